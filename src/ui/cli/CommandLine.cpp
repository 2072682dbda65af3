#include "CommandLine.hpp"
#include "DirectoryScan.hpp"
#include "KeyFile.hpp"
#include "cokacenc/core/ChunkService.hpp"
#include "cokacenc/security/ScopeWipe.hpp"

#include <CLI/CLI.hpp>
#include <array>
#include <iomanip>
#include <optional>
#include <sstream>
#include <system_error>
#include <variant>

namespace cokacenc::ui::cli
{

namespace
{

std::string formatSize(std::uint64_t bytes)
{
    constexpr std::array<const char*, 4> kUnits{ "B", "KiB", "MiB", "GiB" };
    constexpr double kStep{ 1024.0 };

    double value = static_cast<double>(bytes);
    std::size_t unit = 0U;
    while (value >= kStep && unit + 1U < kUnits.size())
    {
        value /= kStep;
        ++unit;
    }

    std::ostringstream os;
    if (unit == 0U)
    {
        os << bytes << " B";
    }
    else
    {
        os << std::fixed << std::setprecision(1) << value << ' ' << kUnits[unit];
    }
    return os.str();
}

void reportFailure(std::ostream& err, const std::string& what, const cokacenc::core::ChunkFailure& failure)
{
    err << "  Failed: " << what << ": " << cokacenc::core::describeError(failure.code);
    if (!failure.path.empty())
    {
        err << " [" << failure.path.string() << "]";
    }
    err << "\n";
}

void reportSummary(std::ostream& out, std::size_t succeeded, std::size_t failed)
{
    out << succeeded << " succeeded, " << failed << " failed\n";
}

std::optional<cokacenc::security::SecureString> loadSecret(std::ostream& err, const std::string& keyPath)
{
    try
    {
        return loadKeyFile(keyPath);
    }
    catch (const std::exception& e)
    {
        err << "Error: " << e.what() << "\n";
        return std::nullopt;
    }
}

void printProgress(std::ostream& out, const cokacenc::core::ChunkProgress& p)
{
    if (p.phase == cokacenc::core::ChunkPhase::Encrypted)
    {
        const auto label = cokacenc::core::sequenceLabel(p.index);
        out << "  chunk " << label.value_or("????") << " (" << formatSize(p.plaintextBytes) << ")\n";
    }
    else
    {
        out << "  <- " << p.chunkPath.filename().string() << " (" << formatSize(p.plaintextBytes) << ")\n";
    }
}

} // namespace

CommandLine::CommandLine(cokacenc::crypto::ICryptoProvider& crypto, std::ostream& out, std::ostream& err,
                         cokacenc::crypto::Pbkdf2Params kdf)
    : m_crypto(crypto), m_out(out), m_err(err), m_kdf(kdf)
{
}

int CommandLine::run(const std::vector<std::string>& args)
{
    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    argv.push_back("cokacenc");
    for (const auto& arg : args)
    {
        argv.push_back(arg.c_str());
    }
    return run(static_cast<int>(argv.size()), argv.data());
}

int CommandLine::run(int argc, const char* const* argv)
{
    CLI::App app{ "Chunked AES-256-CBC file encryption", "cokacenc" };
    app.require_subcommand(1);

    std::string dirArg;
    std::string keyArg;

    // GENERATE
    std::string outputArg;
    std::size_t lengthArg{ g_kDefaultKeyBytes };
    bool forceArg{ false };
    auto* subGenerate = app.add_subcommand("generate", "Write a random Base64 key file");
    subGenerate->add_option("--output", outputArg, "Key file to create")->required();
    subGenerate->add_option("--length", lengthArg, "Number of random bytes")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    subGenerate->add_flag("--force", forceArg, "Overwrite an existing file");

    // PACK
    std::uint64_t sizeArg{ cokacenc::core::g_kDefaultChunkMiB };
    bool deleteOriginalsArg{ false };
    auto* subPack = app.add_subcommand("pack", "Encrypt every file in a directory into .cokacenc chunks");
    subPack->add_option("--dir", dirArg, "Directory to pack")->required()->check(CLI::ExistingDirectory);
    subPack->add_option("--key", keyArg, "Key file")->required()->check(CLI::ExistingFile);
    subPack->add_option("--size", sizeArg, "Maximum chunk size in MiB, 0 disables splitting")->capture_default_str();
    subPack->add_flag("--delete", deleteOriginalsArg, "Delete each original after it was packed");

    // UNPACK
    bool deleteChunksArg{ false };
    auto* subUnpack = app.add_subcommand("unpack", "Decrypt, merge and verify .cokacenc chunks in a directory");
    subUnpack->add_option("--dir", dirArg, "Directory holding the chunks")->required()->check(CLI::ExistingDirectory);
    subUnpack->add_option("--key", keyArg, "Key file used for packing")->required()->check(CLI::ExistingFile);
    subUnpack->add_flag("--delete", deleteChunksArg, "Delete chunks after the merged file was verified");

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError& e)
    {
        const int code = app.exit(e, m_out, m_err);
        return code == 0 ? 0 : 1;
    }

    if (subGenerate->parsed())
    {
        return doGenerate(outputArg, lengthArg, forceArg);
    }
    if (subPack->parsed())
    {
        return doPack(dirArg, keyArg, sizeArg, deleteOriginalsArg);
    }
    if (subUnpack->parsed())
    {
        return doUnpack(dirArg, keyArg, deleteChunksArg);
    }
    return 1;
}

// --- Handlers ---

int CommandLine::doGenerate(const std::string& output, std::size_t length, bool force)
{
    try
    {
        const std::size_t chars = generateKeyFile(output, length, force);
        m_out << "Generated key file: " << output << " (" << length << " random bytes, " << chars
              << " chars Base64)\n";
        return 0;
    }
    catch (const std::exception& e)
    {
        m_err << "Error: " << e.what() << "\n";
        return 1;
    }
}

int CommandLine::doPack(const std::string& dir, const std::string& keyPath, std::uint64_t sizeMiB,
                        bool deleteOriginals)
{
    const auto chunkBytes = cokacenc::core::chunkBytesFromMiB(sizeMiB);
    if (!chunkBytes)
    {
        m_err << "Error: " << cokacenc::core::describeError(cokacenc::core::ChunkError::InvalidChunkSize) << "\n";
        return 1;
    }
    const cokacenc::core::PackOptions options{ .chunkBytes = *chunkBytes,
                                               .deleteOriginal = deleteOriginals,
                                               .kdf = m_kdf };
    if (const auto invalid = cokacenc::core::validatePackOptions(options))
    {
        m_err << "Error: " << cokacenc::core::describeError(*invalid) << "\n";
        return 1;
    }

    auto secret = loadSecret(m_err, keyPath);
    if (!secret)
    {
        return 1;
    }
    auto wipeSecret = cokacenc::security::scopeWipe(*secret);

    std::vector<std::filesystem::path> files;
    try
    {
        files = packCandidates(dir);
    }
    catch (const std::filesystem::filesystem_error& e)
    {
        m_err << "Error: " << e.what() << "\n";
        return 1;
    }
    if (files.empty())
    {
        m_out << "No files to pack in " << dir << "\n";
        return 0;
    }

    cokacenc::core::ChunkService service{ m_crypto };
    service.setProgressSink([this](const cokacenc::core::ChunkProgress& p) { printProgress(m_out, p); });

    std::size_t succeeded = 0U;
    std::size_t failed = 0U;
    for (const auto& file : files)
    {
        const std::string name = file.filename().string();
        std::error_code ec;
        const auto size = std::filesystem::file_size(file, ec);
        m_out << "Packing: " << name;
        if (!ec)
        {
            m_out << " (" << formatSize(size) << ")";
        }
        m_out << "\n";

        const auto result = service.packFile(file, *secret, options);
        if (const auto* failure = std::get_if<cokacenc::core::ChunkFailure>(&result))
        {
            reportFailure(m_err, name, *failure);
            ++failed;
            continue;
        }

        const auto& packed = std::get<cokacenc::core::PackedFile>(result);
        for (const auto& chunk : packed.chunks)
        {
            m_out << "  -> " << chunk.filename().string() << "\n";
        }
        m_out << "  Done: " << name << " (content " << packed.contentHash << ", " << packed.chunks.size()
              << " chunk(s))\n";
        ++succeeded;
    }

    reportSummary(m_out, succeeded, failed);
    return failed == 0U ? 0 : 1;
}

int CommandLine::doUnpack(const std::string& dir, const std::string& keyPath, bool deleteChunks)
{
    const cokacenc::core::UnpackOptions options{ .deleteChunks = deleteChunks, .kdf = m_kdf };
    if (const auto invalid = cokacenc::core::validateUnpackOptions(options))
    {
        m_err << "Error: " << cokacenc::core::describeError(*invalid) << "\n";
        return 1;
    }

    auto secret = loadSecret(m_err, keyPath);
    if (!secret)
    {
        return 1;
    }
    auto wipeSecret = cokacenc::security::scopeWipe(*secret);

    std::vector<std::filesystem::path> candidates;
    try
    {
        candidates = chunkCandidates(dir);
    }
    catch (const std::filesystem::filesystem_error& e)
    {
        m_err << "Error: " << e.what() << "\n";
        return 1;
    }

    cokacenc::core::ChunkService service{ m_crypto };
    service.setProgressSink([this](const cokacenc::core::ChunkProgress& p) { printProgress(m_out, p); });

    const auto grouped = service.groupAndOrder(candidates);
    if (grouped.groups.empty() && grouped.malformed.empty())
    {
        m_out << "No .cokacenc files found in " << dir << "\n";
        return 0;
    }

    std::size_t succeeded = 0U;
    std::size_t failed = 0U;
    for (const auto& bad : grouped.malformed)
    {
        m_err << "Skipped: " << bad.key.originalName << " (" << bad.paths.size()
              << " chunk(s)): " << cokacenc::core::describeError(bad.error) << "\n";
        ++failed;
    }

    for (const auto& [key, paths] : grouped.groups)
    {
        m_out << "Unpacking: " << key.originalName << " (" << paths.size() << " chunk(s))\n";

        const auto result = service.unpackGroup(paths, *secret, options);
        if (const auto* failure = std::get_if<cokacenc::core::ChunkFailure>(&result))
        {
            reportFailure(m_err, key.originalName, *failure);
            ++failed;
            continue;
        }

        const auto& unpacked = std::get<cokacenc::core::UnpackedFile>(result);
        m_out << "  Done: " << unpacked.outputPath.filename().string()
              << (unpacked.verified ? " (content hash verified)" : "") << "\n";
        ++succeeded;
    }

    reportSummary(m_out, succeeded, failed);
    return failed == 0U ? 0 : 1;
}

} // namespace cokacenc::ui::cli
