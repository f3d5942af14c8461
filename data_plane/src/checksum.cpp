#include "segxfer/checksum.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace segxfer {

namespace {

std::string to_hex(const unsigned char *digest, unsigned int length) {
    std::ostringstream oss;
    oss << std::hex << std::nouppercase << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<unsigned int>(digest[i]);
    }
    return oss.str();
}

} // namespace

std::string Checksum::sha256_hex(const std::vector<char> &data) {
    Sha256Accumulator accumulator;
    accumulator.update(data.data(), data.size());
    return accumulator.hex();
}

std::string Checksum::sha256_hex(const std::string &data) {
    Sha256Accumulator accumulator;
    accumulator.update(data.data(), data.size());
    return accumulator.hex();
}

void Checksum::Sha256Accumulator::ContextDeleter::operator()(EVP_MD_CTX *ctx) const {
    EVP_MD_CTX_free(ctx);
}

Checksum::Sha256Accumulator::Sha256Accumulator() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
}

Checksum::Sha256Accumulator::~Sha256Accumulator() = default;

Checksum::Sha256Accumulator::Sha256Accumulator(Sha256Accumulator &&other) noexcept = default;

Checksum::Sha256Accumulator &
Checksum::Sha256Accumulator::operator=(Sha256Accumulator &&other) noexcept = default;

void Checksum::Sha256Accumulator::update(const char *data, std::size_t size) {
    if (data == nullptr || size == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

std::string Checksum::Sha256Accumulator::hex() const {
    // Finalize a copy so the running state can keep accumulating.
    std::unique_ptr<EVP_MD_CTX, ContextDeleter> copy(EVP_MD_CTX_new());
    if (!copy || EVP_MD_CTX_copy_ex(copy.get(), ctx_.get()) != 1) {
        throw std::runtime_error("EVP_MD_CTX_copy_ex failed");
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(copy.get(), digest, &length) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return to_hex(digest, length);
}

} // namespace segxfer
