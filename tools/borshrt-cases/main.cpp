//===----------------------------------------------------------------------===//
//
// Part of the borshrt project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry point for the `borshrt-cases` inspection tool.
///
/// The tool lists the registered round-trip cases, emits their canonical
/// encodings, and runs the oracle in-process on a captured input. Failures are
/// reported and turned into a non-zero exit status instead of terminating.
///
//===----------------------------------------------------------------------===//

#include "borshrt/Codec/Serde.h"
#include "borshrt/Harness/CaseRegistry.h"
#include "borshrt/Harness/OwnedBuffer.h"
#include "borshrt/Harness/RoundTripOracle.h"
#include "borshrt/Support/HarnessConfig.h"
#include "borshrt/Support/Trace.h"
#include "borshrt/Version.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdint>
#include <memory>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

namespace
{

bool isHelpToken(llvm::StringRef arg)
{
    return arg == "--help" || arg == "-h";
}

/// @brief Prints compact usage guidance for invalid CLI invocations.
void printUsage()
{
    llvm::errs() << "Usage: borshrt-cases <list|emit|check> [args]\n"
                 << "Try: borshrt-cases --help\n";
}

void printHelp()
{
    llvm::errs() << "NAME\n"
                 << "  borshrt-cases - inspect the Borsh round-trip conformance cases\n\n"
                 << "SYNOPSIS\n"
                 << "  borshrt-cases list\n"
                 << "  borshrt-cases emit <id> [-o <file>]\n"
                 << "  borshrt-cases check <id> <file|->\n"
                 << "  borshrt-cases --version\n\n"
                 << "COMMANDS\n"
                 << "  list   Print id, name and type of every registered case.\n"
                 << "  emit   Write the canonical encoding of a case to stdout or <file>.\n"
                 << "  check  Run the round-trip oracle on an encoded input read from <file>\n"
                 << "         or stdin, and print the canonical output bytes in hex.\n\n"
                 << "ENVIRONMENT\n"
                 << "  BORSHRT_MAX_DEPTH  Maximum codec nesting depth, 1..255 (default 32).\n"
                 << "  BORSHRT_TRACE      off, basic or verbose; verbose traces each command to stderr.\n";
}

/// @brief Parses a decimal case identifier in the range 0..255.
bool parseCaseId(llvm::StringRef text, std::uint8_t& out)
{
    unsigned value = 0;
    if (text.getAsInteger(10, value) || value > 0xFFU)
    {
        llvm::errs() << "Invalid case id: " << text << "\n";
        return false;
    }
    out = static_cast<std::uint8_t>(value);
    return true;
}

int runList(const borshrt::CaseRegistry& registry)
{
    for (const borshrt::TestCase& testCase : registry.cases())
    {
        llvm::outs() << static_cast<unsigned>(testCase.id) << "\t" << testCase.name << "\t"
                     << borshrt::caseTypeName(testCase.canonical) << "\n";
    }
    return 0;
}

int runEmit(const borshrt::CaseRegistry&  registry,
            const borshrt::HarnessConfig& config,
            const std::uint8_t            id,
            const std::string&            outPath)
{
    llvm::Expected<const borshrt::TestCase&> testCase = registry.resolve(id);
    if (!testCase)
    {
        llvm::errs() << "[borshrt-cases] " << llvm::toString(testCase.takeError()) << "\n";
        return 1;
    }

    llvm::Expected<std::vector<std::uint8_t>> bytes = std::visit(
        [&](const auto& canonical) { return borshrt::serializeToVector(canonical, config.maxRecursionDepth); },
        testCase->canonical);
    if (!bytes)
    {
        llvm::errs() << "[borshrt-cases] encoding case " << static_cast<unsigned>(id)
                     << " failed: " << llvm::toString(bytes.takeError()) << "\n";
        return 1;
    }

    const llvm::StringRef payload(reinterpret_cast<const char*>(bytes->data()), bytes->size());
    if (outPath.empty() || outPath == "-")
    {
        llvm::outs() << payload;
        llvm::outs().flush();
        return 0;
    }

    std::error_code      ec;
    llvm::raw_fd_ostream out(outPath, ec, llvm::sys::fs::OF_None);
    if (ec)
    {
        llvm::errs() << "[borshrt-cases] cannot open " << outPath << ": " << ec.message() << "\n";
        return 1;
    }
    out << payload;
    out.close();
    if (out.has_error())
    {
        llvm::errs() << "[borshrt-cases] failed writing " << outPath << ": " << out.error().message() << "\n";
        out.clear_error();
        return 1;
    }
    return 0;
}

int runCheck(const borshrt::CaseRegistry&  registry,
             const borshrt::HarnessConfig& config,
             const std::uint8_t            id,
             const std::string&            inPath)
{
    llvm::ErrorOr<std::unique_ptr<llvm::MemoryBuffer>> input = llvm::MemoryBuffer::getFileOrSTDIN(inPath);
    if (!input)
    {
        llvm::errs() << "[borshrt-cases] cannot read " << inPath << ": " << input.getError().message() << "\n";
        return 1;
    }

    const llvm::StringRef                contents = (*input)->getBuffer();
    const llvm::ArrayRef<std::uint8_t>   bytes(reinterpret_cast<const std::uint8_t*>(contents.data()),
                                         contents.size());
    const borshrt::RoundTripOracle       oracle(registry, config.oracleOptions());
    borshrt::trace(borshrt::TraceLevel::Verbose,
                   "check case " + llvm::Twine(static_cast<unsigned>(id)) + ": " + llvm::Twine(bytes.size()) +
                       " input bytes");
    llvm::Expected<borshrt::OwnedBuffer> result = oracle.run(id, bytes);
    if (!result)
    {
        llvm::errs() << "[borshrt-cases] " << llvm::toString(result.takeError()) << "\n";
        return 1;
    }
    borshrt::trace(borshrt::TraceLevel::Verbose,
                   "check case " + llvm::Twine(static_cast<unsigned>(id)) + ": " + llvm::Twine(result->size()) +
                       " output bytes");

    llvm::outs() << llvm::toHex(llvm::ArrayRef<std::uint8_t>(result->data(), result->size()), /*LowerCase=*/true)
                 << "\n";
    return 0;
}

}  // namespace

int main(int argc, char** argv)
{
    llvm::InitLLVM y(argc, argv);

    if (argc < 2)
    {
        printUsage();
        return 1;
    }

    const std::string command = argv[1];
    if (isHelpToken(command) || command == "help")
    {
        printHelp();
        return 0;
    }
    if (command == "--version" || command == "-V")
    {
        llvm::outs() << "borshrt-cases " << borshrt::kVersionString << "\n";
        return 0;
    }

    llvm::Expected<borshrt::HarnessConfig> config = borshrt::loadHarnessConfigFromEnvironment();
    if (!config)
    {
        llvm::errs() << "[borshrt-cases] " << llvm::toString(config.takeError()) << "\n";
        return 1;
    }
    borshrt::TraceSink::instance().setLevel(config->traceLevel);
    borshrt::trace(borshrt::TraceLevel::Verbose,
                   llvm::Twine("borshrt-cases ") + command + ": max depth " +
                       llvm::Twine(config->maxRecursionDepth));
    const borshrt::CaseRegistry& registry = borshrt::CaseRegistry::builtin();

    if (command == "list")
    {
        if (argc != 2)
        {
            printUsage();
            return 1;
        }
        return runList(registry);
    }

    if (command == "emit")
    {
        std::uint8_t id = 0;
        std::string  outPath;
        bool         haveId = false;
        for (int i = 2; i < argc; ++i)
        {
            const llvm::StringRef arg(argv[i]);
            if (arg == "-o" || arg == "--output")
            {
                if (i + 1 >= argc)
                {
                    llvm::errs() << "Missing value for " << arg << "\n";
                    printUsage();
                    return 1;
                }
                outPath = argv[++i];
            }
            else if (!haveId)
            {
                if (!parseCaseId(arg, id))
                {
                    return 1;
                }
                haveId = true;
            }
            else
            {
                llvm::errs() << "Unexpected argument: " << arg << "\n";
                printUsage();
                return 1;
            }
        }
        if (!haveId)
        {
            printUsage();
            return 1;
        }
        return runEmit(registry, *config, id, outPath);
    }

    if (command == "check")
    {
        std::uint8_t id = 0;
        if (argc != 4 || !parseCaseId(argv[2], id))
        {
            printUsage();
            return 1;
        }
        return runCheck(registry, *config, id, argv[3]);
    }

    llvm::errs() << "Unknown command: " << command << "\n";
    printUsage();
    return 1;
}
