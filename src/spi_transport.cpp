/*
 * spi_transport.cpp -- PiXtend transport over Linux spidev
 */

#include "spi_transport.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <linux/gpio.h>
#include <linux/spi/spidev.h>

#include "errors.h"

static_assert (PIXTEND_CYCLE_GAP_MS < 1000, "cycle gap must fit in tv_nsec");

void
pixtend_spi_config_init (struct pixtend_spi_config *cfg)
{
  memset (cfg, 0, sizeof (*cfg));
  strncpy (cfg->device, "/dev/spidev0.0", sizeof (cfg->device) - 1);
  strncpy (cfg->dac_device, "/dev/spidev0.1", sizeof (cfg->dac_device) - 1);
  strncpy (cfg->gpio_chip, "/dev/gpiochip0", sizeof (cfg->gpio_chip) - 1);
  cfg->enable_line = PIXTEND_SPI_ENABLE_LINE;
  cfg->speed_hz = PIXTEND_SPI_SPEED_HZ;
}

SpiTransport::SpiTransport (const struct pixtend_spi_config *cfg)
  : m_cfg (*cfg),
    m_spi_fd (-1),
    m_dac_fd (-1),
    m_enable_fd (-1),
    m_have_cycle (false)
{
  memset (&m_last_cycle, 0, sizeof (m_last_cycle));
}

SpiTransport::~SpiTransport ()
{
  close ();
}

/*
 * Request the SPI enable line as an output driven high.  The returned
 * line handle keeps it claimed until closed.
 */
int
SpiTransport::claim_enable_line ()
{
  int chip = ::open (m_cfg.gpio_chip, O_RDWR | O_CLOEXEC);
  if (chip < 0)
    return PIXTEND_ERR_TRANSPORT_UNAVAILABLE;

  struct gpiohandle_request req;
  memset (&req, 0, sizeof (req));
  req.lineoffsets[0] = m_cfg.enable_line;
  req.lines = 1;
  req.flags = GPIOHANDLE_REQUEST_OUTPUT;
  req.default_values[0] = 1;
  strncpy (req.consumer_label, "pixtend", sizeof (req.consumer_label) - 1);

  int rc = ioctl (chip, GPIO_GET_LINEHANDLE_IOCTL, &req);
  ::close (chip);
  if (rc < 0)
    return PIXTEND_ERR_TRANSPORT_UNAVAILABLE;

  m_enable_fd = req.fd;
  return PIXTEND_OK;
}

/* Open a spidev node in mode 0, 8 bits per word, at the configured clock. */
int
SpiTransport::open_device (const char *path, int *fd)
{
  uint8_t mode = SPI_MODE_0;
  uint8_t bits = 8;
  uint32_t speed = m_cfg.speed_hz;

  *fd = ::open (path, O_RDWR | O_CLOEXEC);
  if (*fd < 0)
    return PIXTEND_ERR_TRANSPORT_UNAVAILABLE;

  if (ioctl (*fd, SPI_IOC_WR_MODE, &mode) < 0
      || ioctl (*fd, SPI_IOC_WR_BITS_PER_WORD, &bits) < 0
      || ioctl (*fd, SPI_IOC_WR_MAX_SPEED_HZ, &speed) < 0)
    {
      ::close (*fd);
      *fd = -1;
      return PIXTEND_ERR_TRANSPORT_UNAVAILABLE;
    }
  return PIXTEND_OK;
}

int
SpiTransport::open ()
{
  close ();

  int rc = claim_enable_line ();
  if (rc == PIXTEND_OK)
    rc = open_device (m_cfg.device, &m_spi_fd);
  if (rc == PIXTEND_OK)
    rc = open_device (m_cfg.dac_device, &m_dac_fd);
  if (rc != PIXTEND_OK)
    close ();
  return rc;
}

void
SpiTransport::close ()
{
  if (m_spi_fd >= 0)
    ::close (m_spi_fd);
  if (m_dac_fd >= 0)
    ::close (m_dac_fd);
  if (m_enable_fd >= 0)
    ::close (m_enable_fd);
  m_spi_fd = -1;
  m_dac_fd = -1;
  m_enable_fd = -1;
  m_have_cycle = false;
}

int64_t
pixtend_cycle_wait_ns (const struct timespec *last, const struct timespec *now)
{
  const int64_t gap_ns = (int64_t) PIXTEND_CYCLE_GAP_MS * 1000000;
  int64_t elapsed_ns = ((int64_t) now->tv_sec - (int64_t) last->tv_sec)
                       * 1000000000
                       + ((int64_t) now->tv_nsec - (int64_t) last->tv_nsec);

  if (elapsed_ns >= gap_ns)
    return 0;
  if (elapsed_ns < 0)
    return gap_ns;
  return gap_ns - elapsed_ns;
}

/* Sleep until PIXTEND_CYCLE_GAP_MS have passed since the last cycle. */
void
SpiTransport::wait_cycle_gap ()
{
  if (!m_have_cycle)
    return;

  struct timespec now;
  clock_gettime (CLOCK_MONOTONIC, &now);
  int64_t wait_ns = pixtend_cycle_wait_ns (&m_last_cycle, &now);
  if (wait_ns == 0)
    return;

  /* The gap is below one second */
  struct timespec rest;
  rest.tv_sec = 0;
  rest.tv_nsec = (long) wait_ns;
  while (nanosleep (&rest, &rest) < 0 && errno == EINTR)
    ;
}

/*
 * SpiTransport::exchange -- One full-duplex transfer of TX_LEN bytes.
 *
 * A disconnected board leaves MISO floating, which reads back as all
 * 0x00 or all 0xFF; that is reported as a timeout.
 */
int
SpiTransport::exchange (const uint8_t *tx, size_t tx_len,
                        uint8_t *rx, size_t rx_size, size_t *rx_len)
{
  *rx_len = 0;
  if (m_spi_fd < 0 || tx_len > rx_size)
    return PIXTEND_ERR_BUS;

  wait_cycle_gap ();

  struct spi_ioc_transfer xfer;
  memset (&xfer, 0, sizeof (xfer));
  xfer.tx_buf = (unsigned long) tx;
  xfer.rx_buf = (unsigned long) rx;
  xfer.len = (uint32_t) tx_len;
  xfer.speed_hz = m_cfg.speed_hz;
  xfer.bits_per_word = 8;

  int rc = ioctl (m_spi_fd, SPI_IOC_MESSAGE (1), &xfer);
  clock_gettime (CLOCK_MONOTONIC, &m_last_cycle);
  m_have_cycle = true;
  if (rc < 0)
    return PIXTEND_ERR_BUS;

  *rx_len = tx_len;

  bool floating = tx_len > 0 && (rx[0] == 0x00 || rx[0] == 0xFF);
  for (size_t i = 1; floating && i < tx_len; i++)
    if (rx[i] != rx[0])
      floating = false;
  if (floating)
    return PIXTEND_ERR_TRANSPORT_TIMEOUT;

  return PIXTEND_OK;
}

int
SpiTransport::write_dac (const uint8_t *word, size_t len)
{
  if (m_dac_fd < 0)
    return PIXTEND_ERR_BUS;

  struct spi_ioc_transfer xfer;
  memset (&xfer, 0, sizeof (xfer));
  xfer.tx_buf = (unsigned long) word;
  xfer.len = (uint32_t) len;
  xfer.speed_hz = m_cfg.speed_hz;
  xfer.bits_per_word = 8;

  if (ioctl (m_dac_fd, SPI_IOC_MESSAGE (1), &xfer) < 0)
    return PIXTEND_ERR_BUS;
  return PIXTEND_OK;
}
