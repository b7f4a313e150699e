#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>

// Write-only SPI link to the panel. Chip select is asserted by the driver for
// the duration of each write.
class SpiChannel {
 public:
  virtual ~SpiChannel() = default;

  // Fails without sending anything when length exceeds maxTransfer().
  virtual bool write(const uint8_t *data, size_t length, std::string *error = nullptr) = 0;
  virtual size_t maxTransfer() const = 0;
  virtual void close() = 0;
};

class SpidevChannel : public SpiChannel {
 public:
  SpidevChannel();
  ~SpidevChannel() override;

  bool open(const std::string &devicePath,
            uint32_t speedHz,
            size_t maxTransfer,
            std::string *error = nullptr);

  bool write(const uint8_t *data, size_t length, std::string *error = nullptr) override;
  size_t maxTransfer() const override;
  void close() override;

 private:
  int fd_ = -1;
  uint32_t speedHz_ = 0;
  size_t maxTransfer_ = 0;
};
