#pragma once

#include <Arduino.h>
#include <vector>

#include "ColorSpec.h"
#include "ColorTypes.h"

class ColorEventRegistry;

// Completion token handed to a match handler. Calling it marks the handler as
// finished so the next matching stable color may invoke it again. Copies are
// cheap; the token may be kept and called after the handler has returned.
class MatchDone {
public:
    MatchDone() = default;

    void operator()() const;
    bool isValid() const { return registry_ != nullptr; }
    uint32_t handlerId() const { return handlerId_; }

private:
    friend class ColorEventRegistry;
    MatchDone(ColorEventRegistry* registry, uint32_t handlerId)
        : registry_(registry), handlerId_(handlerId) {}

    ColorEventRegistry* registry_ = nullptr;
    uint32_t handlerId_ = 0;
};

// done, matched stable color, the color spec it matched, user pointer given at registration
typedef void (*MatchHandler)(MatchDone done, const Color& color, const ColorSpec& spec, void* user);

/**
 * @brief Maps registered color specs to ordered handler lists
 *
 * dispatch() runs once per published stable color. A handler is invoked only
 * while it is not already running; it stays "running" until its MatchDone
 * token is called.
 */
class ColorEventRegistry {
public:
    ColorEventRegistry() = default;
    // MatchDone tokens point at this instance
    ColorEventRegistry(const ColorEventRegistry&) = delete;
    ColorEventRegistry& operator=(const ColorEventRegistry&) = delete;

    // A null handler removes every handler registered for the color spec.
    // Returns the new handler id, or 0 when the call deregistered the color spec.
    uint32_t registerHandler(SpecId id, const ColorSpec& spec, MatchHandler handler, void* user = nullptr);

    bool unregister(SpecId id);
    void clear();

    // Invoke the idle handlers of every spec that matches color, in registration order.
    void dispatch(const Color& color);

    // Clears the running flag of a handler; unknown ids are ignored.
    void complete(uint32_t handlerId);

    size_t specCount() const { return entries_.size(); }
    size_t handlerCount(SpecId id) const;
    bool isRunning(uint32_t handlerId) const;

private:
    struct HandlerRecord {
        uint32_t id;
        MatchHandler fn;
        void* user;
        bool isRunning;
    };

    struct SpecEntry {
        SpecId id;
        ColorSpec spec;
        std::vector<HandlerRecord> handlers;
    };

    SpecEntry* findEntry(SpecId id);
    const SpecEntry* findEntry(SpecId id) const;
    void invokeHandlers(SpecId id, const Color& color);

    std::vector<SpecEntry> entries_;
    uint32_t nextHandlerId_ = 1;
};
