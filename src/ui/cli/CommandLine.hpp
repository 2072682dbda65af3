#ifndef COKACENC_UI_CLI_COMMANDLINE_HPP
#define COKACENC_UI_CLI_COMMANDLINE_HPP

#include "cokacenc/crypto/ICryptoProvider.hpp"
#include "cokacenc/crypto/KdfParams.hpp"

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace cokacenc::ui::cli
{

// `generate`, `pack` and `unpack` front-end. Progress goes to `out`, errors and the usage text for bad
// arguments go to `err`.
class CommandLine final
{
public:
    CommandLine(cokacenc::crypto::ICryptoProvider& crypto, std::ostream& out, std::ostream& err,
                cokacenc::crypto::Pbkdf2Params kdf = cokacenc::crypto::g_kPbkdf2DefaultParams);

    // Returns the process exit status: 0 only when every file succeeded.
    [[nodiscard]] int run(int argc, const char* const* argv);

    // Same as run(argc, argv) without the program name.
    [[nodiscard]] int run(const std::vector<std::string>& args);

private:
    cokacenc::crypto::ICryptoProvider& m_crypto;
    std::ostream& m_out;
    std::ostream& m_err;
    cokacenc::crypto::Pbkdf2Params m_kdf;

    int doGenerate(const std::string& output, std::size_t length, bool force);
    int doPack(const std::string& dir, const std::string& keyPath, std::uint64_t sizeMiB, bool deleteOriginals);
    int doUnpack(const std::string& dir, const std::string& keyPath, bool deleteChunks);
};

} // namespace cokacenc::ui::cli

#endif // COKACENC_UI_CLI_COMMANDLINE_HPP
