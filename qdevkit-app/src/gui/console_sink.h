// console_sink.h - spdlog sink that feeds the in-app Console
#pragma once

#include "gui/console.h"
#include <spdlog/sinks/base_sink.h>
#include <spdlog/details/null_mutex.h>
#include <mutex>

namespace qdevkit::app::gui {

template<typename Mutex>
class ConsoleSink : public spdlog::sinks::base_sink<Mutex> {
public:
    explicit ConsoleSink(Console* console) : console_(console) {}

    // Stop forwarding before the Console is destroyed
    void Detach() {
        std::lock_guard<Mutex> lock(spdlog::sinks::base_sink<Mutex>::mutex_);
        console_ = nullptr;
    }

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        if (!console_) return;

        // Only the payload; the Console adds its own time and level prefix
        std::string message(msg.payload.data(), msg.payload.size());

        switch (msg.level) {
            case spdlog::level::trace:
            case spdlog::level::debug:
                console_->AddDebug(message);
                break;
            case spdlog::level::warn:
                console_->AddWarning(message);
                break;
            case spdlog::level::err:
            case spdlog::level::critical:
                console_->AddError(message);
                break;
            default:
                console_->AddInfo(message);
                break;
        }
    }

    void flush_() override {}

private:
    Console* console_;
};

using ConsoleSinkMt = ConsoleSink<std::mutex>;
using ConsoleSinkSt = ConsoleSink<spdlog::details::null_mutex>;

} // namespace qdevkit::app::gui
