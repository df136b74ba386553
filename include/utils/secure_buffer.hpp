#ifndef BYTEPROC_UTILS_SECURE_BUFFER_HPP
#define BYTEPROC_UTILS_SECURE_BUFFER_HPP

#include <cstddef>
#include <cstdint>
#include <vector>
#include <openssl/crypto.h>

namespace byteproc::utils {

// Owns sensitive bytes. The storage is overwritten with zeros before it is
// released, whichever path destroys the owner.
class SecureBuffer {
public:
  explicit SecureBuffer(std::vector<uint8_t>&& data) : data_(std::move(data)) {}
  ~SecureBuffer() { wipe(); }

  SecureBuffer(const SecureBuffer&) = delete;
  SecureBuffer& operator=(const SecureBuffer&) = delete;
  SecureBuffer(SecureBuffer&& other) noexcept : data_(std::move(other.data_)) {
    other.data_.clear();
  }
  SecureBuffer& operator=(SecureBuffer&& other) noexcept {
    if (this != &other) {
      wipe();
      data_ = std::move(other.data_);
      other.data_.clear();
    }
    return *this;
  }

  const uint8_t* data() const { return data_.data(); }
  std::size_t size() const { return data_.size(); }
  bool empty() const { return data_.empty(); }
  uint8_t operator[](std::size_t index) const { return data_[index]; }

  // Zeroes the contents and releases them
  void wipe() {
    if (!data_.empty()) {
      OPENSSL_cleanse(data_.data(), data_.size());
      data_.clear();
    }
  }

private:
  std::vector<uint8_t> data_;
};

} // namespace byteproc::utils

#endif // BYTEPROC_UTILS_SECURE_BUFFER_HPP
