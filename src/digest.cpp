#include "sift/digest.h"

#include "sift/logger.h"
#include "sift/perf.h"
#include "sift/string_utils.h"

#include <openssl/evp.h>

#include <format>
#include <fstream>
#include <memory>
#include <system_error>
#include <vector>

namespace sift {

namespace fs = std::filesystem;

namespace {

struct MdContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept {
        if (ctx) EVP_MD_CTX_free(ctx);
    }
};

using MdContextPtr = std::unique_ptr<EVP_MD_CTX, MdContextDeleter>;

const EVP_MD* evp_for(DigestAlgorithm algorithm) {
    switch (algorithm) {
    case DigestAlgorithm::Md5:
        return EVP_md5();
    case DigestAlgorithm::Sha1:
        return EVP_sha1();
    case DigestAlgorithm::Sha256:
        break;
    }
    return EVP_sha256();
}

MdContextPtr make_context(DigestAlgorithm algorithm) {
    MdContextPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), evp_for(algorithm), nullptr) != 1) {
        return nullptr;
    }
    return ctx;
}

std::optional<std::string> finish(EVP_MD_CTX* ctx) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, md, &length) != 1) {
        return std::nullopt;
    }
    std::string hex;
    hex.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        hex += std::format("{:02x}", md[i]);
    }
    return hex;
}

}  // namespace

std::string_view ToString(DigestAlgorithm algorithm) noexcept {
    switch (algorithm) {
    case DigestAlgorithm::Md5:
        return "md5";
    case DigestAlgorithm::Sha1:
        return "sha1";
    case DigestAlgorithm::Sha256:
        break;
    }
    return "sha256";
}

std::optional<DigestAlgorithm> ParseAlgorithm(std::string_view name) {
    const std::string lowered = StringUtils::ToLower(StringUtils::Trim(name));
    if (lowered == "md5") return DigestAlgorithm::Md5;
    if (lowered == "sha1") return DigestAlgorithm::Sha1;
    if (lowered == "sha256") return DigestAlgorithm::Sha256;
    return std::nullopt;
}

std::optional<std::string> Digest(const fs::path& path,
                                  DigestAlgorithm algorithm,
                                  std::size_t chunk_size,
                                  std::stop_token stop) {
    perf::Timer timer("digest::file");
    auto& logger = Logger::instance();

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        logger.debug("digest: {} is not a readable regular file", path.string());
        return std::nullopt;
    }

    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        logger.debug("digest: cannot open {}", path.string());
        return std::nullopt;
    }

    MdContextPtr ctx = make_context(algorithm);
    if (!ctx) {
        logger.error("digest: cannot initialise {} context", ToString(algorithm));
        return std::nullopt;
    }

    if (chunk_size == 0) chunk_size = kDefaultChunkSize;
    std::vector<char> buffer(chunk_size);
    std::uintmax_t total = 0;
    while (input) {
        if (stop.stop_requested()) {
            logger.debug("digest: stopped while reading {}", path.string());
            return std::nullopt;
        }
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize got = input.gcount();
        if (got > 0) {
            if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(got)) != 1) {
                logger.error("digest: update failed for {}", path.string());
                return std::nullopt;
            }
            total += static_cast<std::uintmax_t>(got);
        }
    }
    if (input.bad()) {
        logger.debug("digest: read error on {}", path.string());
        return std::nullopt;
    }

    auto& perf_manager = perf::Manager::Instance();
    perf_manager.IncrementCounter("digest::files");
    perf_manager.IncrementCounter("digest::bytes", total);
    return finish(ctx.get());
}

std::string DigestBytes(std::string_view data, DigestAlgorithm algorithm) {
    MdContextPtr ctx = make_context(algorithm);
    if (!ctx || EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        return {};
    }
    return finish(ctx.get()).value_or(std::string{});
}

} // namespace sift
