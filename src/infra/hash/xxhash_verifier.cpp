#include "xxhash_verifier.hpp"
#include <cerrno>
#include <memory>
#include <vector>
#include <unistd.h>
#include <spdlog/spdlog.h>
#include "../../adapters/fs.hpp"

namespace fcopy::infra {

namespace {

struct StateDeleter {
    void operator()(XXH64_state_t* state) const { XXH64_freeState(state); }
};

using StatePtr = std::unique_ptr<XXH64_state_t, StateDeleter>;

} // namespace

auto XXHashVerifier::hash_file(const std::filesystem::path& path)
    -> Result<XXH64_hash_t>
{
    auto handle = adapters::fs::open_for_read(path);
    if (!handle) {
        return std::unexpected(std::move(handle.error()));
    }

    StatePtr state(XXH64_createState());
    if (!state) {
        return std::unexpected(make_error(ErrorCode::Unknown, "Failed to create XXH64 state"));
    }
    XXH64_reset(state.get(), 0);

    std::vector<char> buffer(CHUNK_SIZE);
    for (;;) {
        ssize_t got = ::read(handle->get(), buffer.data(), buffer.size());
        if (got == -1) {
            if (errno == EINTR) continue;
            return std::unexpected(make_os_error(errno,
                fmt::format("Cannot read {} for hashing", path.string())));
        }
        if (got == 0) break;
        XXH64_update(state.get(), buffer.data(), static_cast<std::size_t>(got));
    }

    return XXH64_digest(state.get());
}

auto XXHashVerifier::verify_files(const std::filesystem::path& src,
                                  const std::filesystem::path& dst)
    -> Result<bool>
{
    XXH64_hash_t digests[2];
    const std::filesystem::path* paths[2] = {&src, &dst};
    for (int i = 0; i < 2; ++i) {
        auto digest = hash_file(*paths[i]);
        if (!digest) {
            return std::unexpected(std::move(digest.error()));
        }
        digests[i] = *digest;
    }

    if (digests[0] != digests[1]) {
        spdlog::warn("Content of {} differs from {} ({:016x} != {:016x})",
                     dst.string(), src.string(), digests[1], digests[0]);
        return false;
    }
    spdlog::debug("Verified {} (xxh64 {:016x})", dst.string(), digests[0]);
    return true;
}

} // namespace fcopy::infra
