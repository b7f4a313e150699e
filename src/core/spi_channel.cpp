#include "spi_channel.h"

#include <errno.h>
#include <fcntl.h>
#include <linux/spi/spidev.h>
#include <string.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include "log.h"

namespace {

constexpr uint8_t kSpiMode = SPI_MODE_0;
constexpr uint8_t kBitsPerWord = 8;

}  // namespace

SpidevChannel::SpidevChannel() = default;

SpidevChannel::~SpidevChannel() {
  close();
}

bool SpidevChannel::open(const std::string &devicePath,
                         uint32_t speedHz,
                         size_t maxTransfer,
                         std::string *error) {
  if (fd_ >= 0) {
    return true;
  }

  const int fd = ::open(devicePath.c_str(), O_RDWR | O_CLOEXEC);
  if (fd < 0) {
    if (error) {
      *error = devicePath + ": " + strerror(errno);
    }
    return false;
  }

  uint8_t mode = kSpiMode;
  uint8_t bits = kBitsPerWord;
  uint32_t speed = speedHz;
  if (ioctl(fd, SPI_IOC_WR_MODE, &mode) < 0 ||
      ioctl(fd, SPI_IOC_WR_BITS_PER_WORD, &bits) < 0 ||
      ioctl(fd, SPI_IOC_WR_MAX_SPEED_HZ, &speed) < 0) {
    if (error) {
      *error = devicePath + " configure failed: " + strerror(errno);
    }
    ::close(fd);
    return false;
  }

  fd_ = fd;
  speedHz_ = speedHz;
  maxTransfer_ = maxTransfer;
  logPrintf("[disp] spi %s mode=0 speed=%uHz max=%zu\n",
            devicePath.c_str(), static_cast<unsigned int>(speedHz_), maxTransfer_);
  return true;
}

bool SpidevChannel::write(const uint8_t *data, size_t length, std::string *error) {
  if (fd_ < 0) {
    if (error) {
      *error = "SPI channel closed";
    }
    return false;
  }
  if (length == 0) {
    return true;
  }
  if (length > maxTransfer_) {
    if (error) {
      *error = "SPI transfer of " + std::to_string(length) + " bytes exceeds " +
               std::to_string(maxTransfer_);
    }
    return false;
  }

  struct spi_ioc_transfer xfer;
  memset(&xfer, 0, sizeof(xfer));
  xfer.tx_buf = reinterpret_cast<unsigned long>(data);
  xfer.len = static_cast<uint32_t>(length);
  xfer.speed_hz = speedHz_;
  xfer.bits_per_word = kBitsPerWord;

  if (ioctl(fd_, SPI_IOC_MESSAGE(1), &xfer) < 0) {
    if (error) {
      *error = std::string("SPI_IOC_MESSAGE: ") + strerror(errno);
    }
    return false;
  }
  return true;
}

size_t SpidevChannel::maxTransfer() const {
  return maxTransfer_;
}

void SpidevChannel::close() {
  if (fd_ < 0) {
    return;
  }
  ::close(fd_);
  fd_ = -1;
}
