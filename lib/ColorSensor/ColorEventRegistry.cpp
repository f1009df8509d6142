#include "ColorEventRegistry.h"
#include "Globals.h"

#ifndef COLOR_EVENTS_DEBUG
#define COLOR_EVENTS_DEBUG 0
#endif

#if COLOR_EVENTS_DEBUG
#define EV_LOG(...) PF(__VA_ARGS__)
#else
#define EV_LOG(...) do {} while (0)
#endif

void MatchDone::operator()() const {
    if (registry_) {
        registry_->complete(handlerId_);
    }
}

uint32_t ColorEventRegistry::registerHandler(SpecId id, const ColorSpec& spec, MatchHandler handler, void* user) {
    if (!handler) {
        if (unregister(id)) {
            EV_LOG("[ColorEvents] spec %u deregistered\n", (unsigned)id);
        }
        return 0;
    }

    SpecEntry* entry = findEntry(id);
    if (!entry) {
        entries_.push_back(SpecEntry{id, spec, {}});
        entry = &entries_.back();
    }

    const uint32_t handlerId = nextHandlerId_++;
    entry->handlers.push_back(HandlerRecord{handlerId, handler, user, false});
    EV_LOG("[ColorEvents] spec %u: handler %lu registered (%u total)\n",
           (unsigned)id, (unsigned long)handlerId, (unsigned)entry->handlers.size());
    return handlerId;
}

bool ColorEventRegistry::unregister(SpecId id) {
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->id == id) {
            entries_.erase(it);
            return true;
        }
    }
    return false;
}

void ColorEventRegistry::clear() {
    entries_.clear();
}

void ColorEventRegistry::dispatch(const Color& color) {
    size_t s = 0;
    while (s < entries_.size()) {
        const SpecId id = entries_[s].id;
        if (entries_[s].spec.isMatch(color)) {
            invokeHandlers(id, color);
        }
        // a handler may have removed this entry; the next one then already sits at s
        if (s < entries_.size() && entries_[s].id == id) {
            ++s;
        }
    }
}

void ColorEventRegistry::invokeHandlers(SpecId id, const Color& color) {
    const SpecEntry* first = findEntry(id);
    if (!first) {
        return;
    }
    // handlers added during this publication wait for the next one
    const size_t count = first->handlers.size();

    for (size_t h = 0; h < count; ++h) {
        // re-resolve after every call, handlers may (de)register specs
        SpecEntry* entry = findEntry(id);
        if (!entry || h >= entry->handlers.size()) {
            return;
        }

        HandlerRecord& rec = entry->handlers[h];
        if (rec.isRunning) {
            continue;
        }
        rec.isRunning = true;

        const MatchHandler fn = rec.fn;
        void* user = rec.user;
        const ColorSpec spec = entry->spec;
        EV_LOG("[ColorEvents] spec %u: invoking handler %lu\n", (unsigned)id, (unsigned long)rec.id);
        fn(MatchDone(this, rec.id), color, spec, user);
    }
}

void ColorEventRegistry::complete(uint32_t handlerId) {
    for (SpecEntry& entry : entries_) {
        for (HandlerRecord& rec : entry.handlers) {
            if (rec.id == handlerId) {
                rec.isRunning = false;
                return;
            }
        }
    }
}

size_t ColorEventRegistry::handlerCount(SpecId id) const {
    const SpecEntry* entry = findEntry(id);
    return entry ? entry->handlers.size() : 0;
}

bool ColorEventRegistry::isRunning(uint32_t handlerId) const {
    for (const SpecEntry& entry : entries_) {
        for (const HandlerRecord& rec : entry.handlers) {
            if (rec.id == handlerId) {
                return rec.isRunning;
            }
        }
    }
    return false;
}

ColorEventRegistry::SpecEntry* ColorEventRegistry::findEntry(SpecId id) {
    for (SpecEntry& entry : entries_) {
        if (entry.id == id) {
            return &entry;
        }
    }
    return nullptr;
}

const ColorEventRegistry::SpecEntry* ColorEventRegistry::findEntry(SpecId id) const {
    for (const SpecEntry& entry : entries_) {
        if (entry.id == id) {
            return &entry;
        }
    }
    return nullptr;
}
