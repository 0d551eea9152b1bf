#pragma once

#include "sidecar/watchdog.hpp"

#include <ftxui/component/component.hpp>
#include <memory>
#include <string>
#include <vector>

enum class EventSeverity {
    Success,
    Warning,
    Error,
};

struct EventEntry {
    std::string time;  // HH:MM:SS, filled on push when empty
    EventSeverity severity = EventSeverity::Success;
    std::string tag;
    std::string message;
};

class EventPanel {
public:
    EventPanel();
    ~EventPanel();

    static EventSeverity severity_of(SidecarEvent event);
    static const char* severity_name(EventSeverity severity);

    // Thread-safe producers
    void push_event(SidecarEvent event, const std::string& message);
    void push(EventEntry entry);

    /// Entries passing the current filter, oldest first
    std::vector<EventEntry> visible_entries() const;

    /// 0=all, 1=success, 2=warning, 3=error
    void set_filter(int level);
    void toggle_freeze();
    bool frozen() const;

    /// True once a restart_exhausted event has been seen
    bool exhausted() const;

    /// Write filtered entries to `path`; false if the file cannot be opened
    bool export_to(const std::string& path) const;

    /// Export to a timestamped file in the working directory; returns its name or ""
    std::string export_default() const;

    ftxui::Component component();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
