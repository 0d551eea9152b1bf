#include "ui/main_screen.hpp"

#include <ftxui/dom/elements.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/component_base.hpp>
#include <atomic>

using namespace ftxui;

struct MainScreen::Impl {
    Callbacks callbacks;
    std::atomic<WatchdogState> state{WatchdogState::Starting};
    std::atomic<bool> checking{false};

    Component content = Renderer([] { return text("Loading..."); });
    Component status_bar = Renderer([] { return text(""); });

    // Handles global shortcuts AFTER the content gets first chance.
    class ScreenComponent : public ComponentBase {
    public:
        explicit ScreenComponent(Impl* impl) : impl_(impl) {}

        bool Focusable() const override {
            for (auto& child : children_) {
                if (child->Focusable()) return true;
            }
            return false;
        }

        Element OnRender() override {
            WatchdogState state = impl_->state.load();
            bool healthy = state == WatchdogState::Healthy;

            Element indicator = healthy
                ? text("● Backend healthy") | color(Color::Green)
                : state == WatchdogState::RestartExhausted
                    ? text("✖ Backend down") | bold | color(Color::Red)
                    : text("○ Backend " + std::string(watchdog_state_name(state)))
                          | color(Color::Yellow);

            auto header = hbox({
                text(" stocksbot-shell ") | bold | color(Color::Cyan),
                separator(),
                impl_->checking.load() ? text(" checking... ") | dim : text(""),
                filler(),
                indicator,
                text(" "),
            });

            auto footer = hbox({
                text(" [H]") | bold,
                text("Health check"),
                text("  [1-4]") | bold,
                text("Filter"),
                text("  [F]") | bold,
                text("Freeze"),
                text("  [X]") | bold,
                text("Export"),
                text("  [Q]") | bold,
                text("Quit"),
                text("  "),
            }) | dim;

            return vbox({
                header,
                separator(),
                impl_->content->Render() | flex,
                separator(),
                impl_->status_bar->Render(),
                footer,
            });
        }

        bool OnEvent(Event event) override {
            if (ComponentBase::OnEvent(event)) {
                return true;
            }

            if (event.is_character()) {
                auto ch = event.character();
                if (ch == "q" || ch == "Q") {
                    if (impl_->callbacks.on_quit) impl_->callbacks.on_quit();
                    return true;
                }
                if (ch == "h" || ch == "H") {
                    if (impl_->callbacks.on_health_check) impl_->callbacks.on_health_check();
                    return true;
                }
            }
            return false;
        }

    private:
        Impl* impl_;
    };
};

MainScreen::MainScreen() : impl_(std::make_unique<Impl>()) {}
MainScreen::~MainScreen() = default;

void MainScreen::set_callbacks(Callbacks cb) { impl_->callbacks = std::move(cb); }
void MainScreen::set_state(WatchdogState state) { impl_->state.store(state); }
void MainScreen::set_checking(bool checking) { impl_->checking.store(checking); }
void MainScreen::set_content(Component content) { impl_->content = std::move(content); }
void MainScreen::set_status_bar(Component status_bar) { impl_->status_bar = std::move(status_bar); }

Component MainScreen::component() {
    auto comp = Make<Impl::ScreenComponent>(impl_.get());
    comp->Add(impl_->content);
    return comp;
}
