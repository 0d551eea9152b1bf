#include "ui/event_panel.hpp"

#include <ftxui/dom/elements.hpp>
#include <ftxui/component/event.hpp>
#include <deque>
#include <mutex>
#include <fstream>
#include <ctime>
#include <iomanip>
#include <sstream>

using namespace ftxui;

static const int MAX_EVENT_LINES = 1000;

namespace {

std::string now_string(const char* format) {
    auto t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, format);
    return oss.str();
}

} // namespace

struct EventPanel::Impl {
    std::deque<EventEntry> entries;
    mutable std::mutex mutex;

    int filter_level = 0;
    bool frozen = false;
    bool exhausted = false;

    bool matches_filter(const EventEntry& entry) const {
        switch (filter_level) {
        case 1: return entry.severity == EventSeverity::Success;
        case 2: return entry.severity == EventSeverity::Warning;
        case 3: return entry.severity == EventSeverity::Error;
        default: return true;
        }
    }

    static Color severity_color(EventSeverity severity) {
        switch (severity) {
        case EventSeverity::Success: return Color::Green;
        case EventSeverity::Warning: return Color::Yellow;
        case EventSeverity::Error: return Color::Red;
        }
        return Color::White;
    }
};

EventPanel::EventPanel() : impl_(std::make_unique<Impl>()) {}
EventPanel::~EventPanel() = default;

EventSeverity EventPanel::severity_of(SidecarEvent event) {
    switch (event) {
    case SidecarEvent::Healthy:
    case SidecarEvent::Restarted: return EventSeverity::Success;
    case SidecarEvent::Unhealthy: return EventSeverity::Warning;
    case SidecarEvent::RestartExhausted: return EventSeverity::Error;
    }
    return EventSeverity::Warning;
}

const char* EventPanel::severity_name(EventSeverity severity) {
    switch (severity) {
    case EventSeverity::Success: return "success";
    case EventSeverity::Warning: return "warning";
    case EventSeverity::Error: return "error";
    }
    return "unknown";
}

void EventPanel::push_event(SidecarEvent event, const std::string& message) {
    EventEntry entry;
    entry.severity = severity_of(event);
    entry.tag = sidecar_event_name(event);
    entry.message = message;
    push(std::move(entry));

    if (event == SidecarEvent::RestartExhausted) {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->exhausted = true;
    }
}

void EventPanel::push(EventEntry entry) {
    if (entry.time.empty()) entry.time = now_string("%H:%M:%S");
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->entries.push_back(std::move(entry));
    while ((int)impl_->entries.size() > MAX_EVENT_LINES) {
        impl_->entries.pop_front();
    }
}

std::vector<EventEntry> EventPanel::visible_entries() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::vector<EventEntry> out;
    for (const auto& entry : impl_->entries) {
        if (impl_->matches_filter(entry)) out.push_back(entry);
    }
    return out;
}

void EventPanel::set_filter(int level) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->filter_level = (level >= 0 && level <= 3) ? level : 0;
}

void EventPanel::toggle_freeze() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->frozen = !impl_->frozen;
}

bool EventPanel::frozen() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->frozen;
}

bool EventPanel::exhausted() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->exhausted;
}

bool EventPanel::export_to(const std::string& path) const {
    std::ofstream out(path);
    if (!out.is_open()) return false;
    for (const auto& entry : visible_entries()) {
        out << entry.time << " [" << severity_name(entry.severity) << "] "
            << entry.tag << ": " << entry.message << "\n";
    }
    return out.good();
}

std::string EventPanel::export_default() const {
    std::string name = "stocksbot-events-" + now_string("%Y%m%d-%H%M%S") + ".log";
    return export_to(name) ? name : "";
}

Component EventPanel::component() {
    auto self = this;
    auto impl = impl_.get();

    return Renderer([self, impl](bool /*focused*/) -> Element {
        int filter_level;
        bool frozen;
        bool exhausted;
        {
            std::lock_guard<std::mutex> lock(impl->mutex);
            filter_level = impl->filter_level;
            frozen = impl->frozen;
            exhausted = impl->exhausted;
        }

        std::string filter_labels[] = {"ALL", "SUCCESS", "WARNING", "ERROR"};
        Elements header_items;
        for (int i = 0; i < 4; i++) {
            auto el = text(" " + std::to_string(i + 1) + ":" + filter_labels[i] + " ");
            if (i == filter_level) {
                el = el | bold | inverted;
            } else {
                el = el | dim;
            }
            header_items.push_back(el);
        }
        header_items.push_back(filler());
        header_items.push_back(
            frozen
                ? text(" [F] Frozen ") | color(Color::Yellow)
                : text(" [F] Freeze ") | dim
        );
        header_items.push_back(text(" [X] Export ") | dim);

        Elements lines;
        for (const auto& entry : self->visible_entries()) {
            lines.push_back(hbox({
                text(entry.time + " ") | dim,
                text("[" + entry.tag + "] ") | bold | color(Impl::severity_color(entry.severity)),
                text(entry.message),
            }));
        }
        if (lines.empty()) {
            lines.push_back(text("  (no events)") | dim);
        }

        auto event_view = vbox(std::move(lines));
        if (!frozen) {
            event_view = event_view | focusPositionRelative(0, 1);
        }

        Elements body;
        if (exhausted) {
            body.push_back(
                text(" Automatic restarts exhausted: backend needs manual attention ")
                | bold | color(Color::White) | bgcolor(Color::Red) | center);
        }
        body.push_back(hbox(std::move(header_items)));
        body.push_back(separator());
        body.push_back(event_view | vscroll_indicator | frame | flex);

        return vbox(std::move(body)) | border;
    }) | CatchEvent([self](Event event) -> bool {
        if (!event.is_character()) return false;
        const std::string& ch = event.character();

        if (ch == "1") { self->set_filter(0); return true; }
        if (ch == "2") { self->set_filter(1); return true; }
        if (ch == "3") { self->set_filter(2); return true; }
        if (ch == "4") { self->set_filter(3); return true; }

        if (ch == "f" || ch == "F") {
            self->toggle_freeze();
            return true;
        }

        if (ch == "x" || ch == "X") {
            std::string file = self->export_default();
            EventEntry note;
            note.tag = "export";
            if (file.empty()) {
                note.severity = EventSeverity::Warning;
                note.message = "Could not write event export";
            } else {
                note.severity = EventSeverity::Success;
                note.message = "Events written to " + file;
            }
            self->push(std::move(note));
            return true;
        }

        return false;
    });
}
