#pragma once

#include "core/logging/logger.hpp"
#include "events/emitter.hpp"

#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

namespace framewatch::monitoring {

// Optional logger/timeline pair handed to every monitoring component. Both
// are borrowed and may be null; library users that want neither pass {}.
class Diagnostics {
public:
  Diagnostics() = default;
  Diagnostics(core::logging::Logger* logger, events::Emitter* emitter)
      : logger_(logger), emitter_(emitter) {}

  core::logging::Logger* logger() const {
    return logger_;
  }
  events::Emitter* emitter() const {
    return emitter_;
  }

  void Log(core::logging::LogLevel level, std::string_view message,
           std::initializer_list<core::logging::LogFieldView> fields = {}) const {
    if (logger_ != nullptr) {
      logger_->Log(level, message, fields);
    }
  }

  // Runs `emit(emitter, error)` when a timeline is attached. A failed write is
  // logged and otherwise ignored; the timeline never changes monitoring state.
  template <typename EmitFn> void Emit(EmitFn&& emit) const {
    if (emitter_ == nullptr) {
      return;
    }
    std::string error;
    if (!std::forward<EmitFn>(emit)(*emitter_, error)) {
      Log(core::logging::LogLevel::kWarn, "event timeline write failed", {{"error", error}});
    }
  }

private:
  core::logging::Logger* logger_ = nullptr;
  events::Emitter* emitter_ = nullptr;
};

} // namespace framewatch::monitoring
