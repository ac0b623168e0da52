//===----------------------------------------------------------------------===//
//
// Part of the borshrt project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "borshrt/Support/Trace.h"

namespace borshrt
{

std::optional<TraceLevel> parseTraceLevel(const llvm::StringRef text)
{
    const llvm::StringRef trimmed = text.trim();
    if (trimmed.equals_insensitive("off"))
    {
        return TraceLevel::Off;
    }
    if (trimmed.equals_insensitive("basic"))
    {
        return TraceLevel::Basic;
    }
    if (trimmed.equals_insensitive("verbose"))
    {
        return TraceLevel::Verbose;
    }
    return std::nullopt;
}

TraceSink& TraceSink::instance()
{
    static TraceSink sink;
    return sink;
}

void TraceSink::setLevel(const TraceLevel level)
{
    level_.store(level, std::memory_order_relaxed);
}

TraceLevel TraceSink::level() const
{
    return level_.load(std::memory_order_relaxed);
}

bool TraceSink::enabled(const TraceLevel level) const
{
    return level != TraceLevel::Off && static_cast<int>(level) <= static_cast<int>(this->level());
}

void TraceSink::setStream(llvm::raw_ostream* const stream)
{
    std::lock_guard<std::mutex> lock(mutex_);
    stream_ = stream;
}

void TraceSink::emit(const TraceLevel level, const llvm::Twine& message)
{
    if (!enabled(level))
    {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    llvm::raw_ostream&          os = stream_ != nullptr ? *stream_ : llvm::errs();
    os << "[borshrt] " << message << "\n";
    os.flush();
}

void trace(const TraceLevel level, const llvm::Twine& message)
{
    TraceSink::instance().emit(level, message);
}

}  // namespace borshrt
