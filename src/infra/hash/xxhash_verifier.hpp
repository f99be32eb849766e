#pragma once

#include <cstddef>
#include <filesystem>
#include "../error_handler/error.hpp"
#include <xxhash.h>

namespace fcopy::infra {

class XXHashVerifier {
public:
    // xxHash64 содержимого файла; ошибки чтения сохраняют errno
    static auto hash_file(const std::filesystem::path& path)
        -> Result<XXH64_hash_t>;

    // true, если содержимое src и dst совпадает
    static auto verify_files(const std::filesystem::path& src,
                             const std::filesystem::path& dst)
        -> Result<bool>;

private:
    static constexpr std::size_t CHUNK_SIZE = 64 * 1024;
};

} // namespace fcopy::infra
