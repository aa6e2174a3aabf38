/*
 * bulkget/src/transfer/integrity_verifier.cpp
 *
 * IntegrityVerifier (OpenSSL EVP)
 *
 * Implements bulkget::transfer::IIntegrityVerifier using OpenSSL's EVP interface.
 * - reset() selects MD5, SHA-256 or SHA-512 (the remote checksum decides which)
 * - update() feeds byte spans to the active digest context
 * - finalize() returns a Checksum { algo, hex } and re-arms the context
 *
 * computeFileDigest() streams a file through a verifier in fixed-size blocks so the
 * whole object is never held in memory.
 */

#include <bulkget/transfer/transfer.hpp>

#include <openssl/evp.h>

#include <array>
#include <cstddef>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace bulkget::transfer {

namespace {

// Simple RAII wrapper for EVP_MD_CTX
struct EvpMdCtx {
    EVP_MD_CTX* ctx{nullptr};
    EvpMdCtx() : ctx(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() {
        if (ctx)
            EVP_MD_CTX_free(ctx);
    }
    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;
    EvpMdCtx(EvpMdCtx&& other) noexcept : ctx(other.ctx) { other.ctx = nullptr; }
    EvpMdCtx& operator=(EvpMdCtx&& other) noexcept {
        if (this != &other) {
            if (ctx)
                EVP_MD_CTX_free(ctx);
            ctx = other.ctx;
            other.ctx = nullptr;
        }
        return *this;
    }
    explicit operator bool() const noexcept { return ctx != nullptr; }
};

inline const EVP_MD* resolve_algo(HashAlgo algo) {
    switch (algo) {
        case HashAlgo::Md5:
            return EVP_md5();
        case HashAlgo::Sha256:
            return EVP_sha256();
        case HashAlgo::Sha512:
            return EVP_sha512();
    }
    return nullptr;
}

inline std::string to_hex_lower(const unsigned char* bytes, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        unsigned v = bytes[i];
        out[2 * i + 0] = kHex[(v >> 4) & 0xF];
        out[2 * i + 1] = kHex[(v >> 0) & 0xF];
    }
    return out;
}

class OpenSslIntegrityVerifier final : public IIntegrityVerifier {
public:
    Expected<void> reset(HashAlgo algo) override {
        _algo = algo;
        _md = resolve_algo(algo);
        _ctx = EvpMdCtx{};
        _ready = false;
        if (!_ctx || !_md) {
            return Error{ErrorCode::Unknown, "EVP digest unavailable"};
        }
        if (EVP_DigestInit_ex(_ctx.ctx, _md, nullptr) != 1) {
            _ctx = EvpMdCtx{};
            return Error{ErrorCode::Unknown, "EVP_DigestInit_ex failed"};
        }
        _ready = true;
        return Expected<void>{};
    }

    void update(std::span<const std::byte> data) override {
        if (!_ready || data.empty())
            return;
        if (EVP_DigestUpdate(_ctx.ctx, data.data(), data.size()) != 1)
            _ready = false;
    }

    Checksum finalize() override {
        Checksum out;
        out.algo = _algo;
        if (!_ready)
            return out; // empty hex signals failure

        std::array<unsigned char, EVP_MAX_MD_SIZE> md_buf{};
        unsigned md_len = 0;
        if (EVP_DigestFinal_ex(_ctx.ctx, md_buf.data(), &md_len) != 1) {
            _ready = false;
            return out;
        }
        out.hex = to_hex_lower(md_buf.data(), md_len);

        // Prepare for potential reuse with the same algorithm
        (void)reset(_algo);
        return out;
    }

private:
    HashAlgo _algo{HashAlgo::Md5};
    const EVP_MD* _md{nullptr};
    EvpMdCtx _ctx{};
    bool _ready{false};
};

} // namespace

std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier() {
    return std::make_unique<OpenSslIntegrityVerifier>();
}

Expected<Checksum> computeFileDigest(const std::filesystem::path& path, HashAlgo algo,
                                     std::size_t blockBytes) {
    if (blockBytes == 0)
        return Error{ErrorCode::InvalidArgument, "computeFileDigest: block size must be > 0"};

    std::ifstream in(path, std::ios::binary);
    if (!in)
        return Error{ErrorCode::IoError, "Failed to open for verification: " + path.string()};

    auto verifier = makeIntegrityVerifier();
    if (auto r = verifier->reset(algo); !r.ok())
        return r.error();

    std::vector<char> buffer(blockBytes);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto got = in.gcount();
        if (got > 0) {
            verifier->update(std::span<const std::byte>(
                reinterpret_cast<const std::byte*>(buffer.data()), static_cast<std::size_t>(got)));
        }
    }
    if (!in.eof())
        return Error{ErrorCode::IoError, "Read failed during verification: " + path.string()};

    auto digest = verifier->finalize();
    if (digest.hex.empty())
        return Error{ErrorCode::Unknown, "Failed to finalize checksum for " + path.string()};
    return digest;
}

} // namespace bulkget::transfer
