#include "ReproVM/System/Sha256.hpp"
#include <array>
#include <cctype>
#include <fstream>
#include <memory>
#include <openssl/err.h>
#include <openssl/evp.h>

namespace ReproVM {

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

std::string opensslError(const char* what) {
    const unsigned long code = ERR_get_error();
    std::array<char, 256> buf{};
    if (code != 0) ERR_error_string_n(code, buf.data(), buf.size());
    return std::string(what) + (code != 0 ? std::string(": ") + buf.data() : std::string());
}

} // namespace

Result<std::string> sha256File(const std::filesystem::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in) return fatal("cannot open " + file.string() + " for hashing");

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) return fatal(opensslError("EVP_MD_CTX_new"));
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) return fatal(opensslError("EVP_DigestInit_ex"));

    std::array<char, 64 * 1024> buf{};
    while (in) {
        in.read(buf.data(), buf.size());
        const auto n = in.gcount();
        if (n > 0 && EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<std::size_t>(n)) != 1) {
            return fatal(opensslError("EVP_DigestUpdate"));
        }
    }
    if (in.bad()) return fatal("read error while hashing " + file.string());

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &len) != 1) return fatal(opensslError("EVP_DigestFinal_ex"));

    static constexpr char kHex[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        hex.push_back(kHex[digest[i] >> 4]);
        hex.push_back(kHex[digest[i] & 0x0F]);
    }
    return hex;
}

Result<void> writeHashRecord(const std::filesystem::path& record, const std::filesystem::path& file) {
    auto digest = sha256File(file);
    if (!digest) return std::unexpected(digest.error());

    const std::filesystem::path tmp = record.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) return fatal("cannot write " + tmp.string());
        out << *digest << "  " << file.filename().string() << '\n';
        if (!out.flush()) return fatal("cannot write " + tmp.string());
    }
    std::error_code ec;
    std::filesystem::rename(tmp, record, ec);
    if (ec) return fatal("cannot install " + record.string() + ": " + ec.message());
    return {};
}

Result<bool> verifyHashRecord(const std::filesystem::path& record, const std::filesystem::path& file) {
    std::ifstream in(record);
    if (!in) return fatal("cannot read hash record " + record.string());
    std::string expected;
    in >> expected;
    for (auto& c : expected) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (expected.size() != 64) return false;

    auto actual = sha256File(file);
    if (!actual) return std::unexpected(actual.error());
    return *actual == expected;
}

} // namespace ReproVM
