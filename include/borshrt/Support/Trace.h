//===----------------------------------------------------------------------===//
//
// Part of the borshrt project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Leveled diagnostic trace written to standard error.
///
/// Lines are prefixed with `[borshrt]`. Emission is serialized so concurrent
/// callers never interleave within a line.
///
//===----------------------------------------------------------------------===//
#ifndef BORSHRT_SUPPORT_TRACE_H
#define BORSHRT_SUPPORT_TRACE_H

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/raw_ostream.h"

#include <atomic>
#include <mutex>
#include <optional>

namespace borshrt
{

/// @brief Trace verbosity level.
enum class TraceLevel
{
    /// @brief Disable trace output.
    Off,

    /// @brief Report failures only.
    Basic,

    /// @brief Also report every boundary call.
    Verbose,
};

/// @brief Parses `off`, `basic` or `verbose`.
[[nodiscard]] std::optional<TraceLevel> parseTraceLevel(llvm::StringRef text);

/// @brief Process-wide trace destination.
class TraceSink final
{
public:
    /// @brief Returns the process-wide sink.
    static TraceSink& instance();

    TraceSink(const TraceSink&)            = delete;
    TraceSink& operator=(const TraceSink&) = delete;

    void setLevel(TraceLevel level);

    [[nodiscard]] TraceLevel level() const;

    /// @brief Returns whether a message at `level` would be written.
    [[nodiscard]] bool enabled(TraceLevel level) const;

    /// @brief Redirects output; `nullptr` restores `llvm::errs()`.
    void setStream(llvm::raw_ostream* stream);

    /// @brief Writes one prefixed line if `level` is enabled.
    void emit(TraceLevel level, const llvm::Twine& message);

private:
    TraceSink() = default;

    std::atomic<TraceLevel> level_{TraceLevel::Basic};
    std::mutex              mutex_;
    llvm::raw_ostream*      stream_ = nullptr;
};

/// @brief Shorthand for `TraceSink::instance().emit(level, message)`.
void trace(TraceLevel level, const llvm::Twine& message);

}  // namespace borshrt

#endif  // BORSHRT_SUPPORT_TRACE_H
