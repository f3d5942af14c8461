#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <openssl/evp.h>

namespace segxfer {

class Checksum {
  public:
    static constexpr const char *sha256_name = "sha256";

    static std::string sha256_hex(const std::vector<char> &data);

    static std::string sha256_hex(const std::string &data);

    // Running SHA-256 over everything passed to update(). hex() may be called
    // at any point and does not finish the accumulator.
    class Sha256Accumulator {
      public:
        Sha256Accumulator();
        ~Sha256Accumulator();

        Sha256Accumulator(Sha256Accumulator &&other) noexcept;
        Sha256Accumulator &operator=(Sha256Accumulator &&other) noexcept;

        void update(const char *data, std::size_t size);

        std::string hex() const;

      private:
        struct ContextDeleter {
            void operator()(EVP_MD_CTX *ctx) const;
        };

        std::unique_ptr<EVP_MD_CTX, ContextDeleter> ctx_;
    };
};

} // namespace segxfer
