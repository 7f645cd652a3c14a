/*
 * spi_transport.h -- PiXtend transport over Linux spidev
 *
 * The main frame goes to the microcontroller on one chip select, DAC
 * words go to the DAC on the other.  Communication is only possible
 * while the board's SPI enable line (a Raspberry Pi GPIO) is high; open()
 * claims that line through the GPIO character device and drives it high.
 */

#ifndef PIXTEND_SPI_TRANSPORT_H
#define PIXTEND_SPI_TRANSPORT_H

#include <stdint.h>
#include <time.h>

#include "transport.h"

#define PIXTEND_SPI_PATH_LEN      64
#define PIXTEND_SPI_SPEED_HZ      700000
#define PIXTEND_SPI_ENABLE_LINE   24

/* Minimum spacing between two main-frame cycles required by the board */
#define PIXTEND_CYCLE_GAP_MS      30

struct pixtend_spi_config
{
  char device[PIXTEND_SPI_PATH_LEN];      /* microcontroller, e.g. /dev/spidev0.0 */
  char dac_device[PIXTEND_SPI_PATH_LEN];  /* DAC, e.g. /dev/spidev0.1 */
  char gpio_chip[PIXTEND_SPI_PATH_LEN];   /* e.g. /dev/gpiochip0 */
  unsigned enable_line;
  uint32_t speed_hz;
};

/* Fill CFG with the Raspberry Pi wiring of the board. */
void pixtend_spi_config_init (struct pixtend_spi_config *cfg);

/*
 * pixtend_cycle_wait_ns -- Time left before the next cycle may start.
 *
 * Args:
 *   last: CLOCK_MONOTONIC time of the previous cycle.
 *   now:  Current CLOCK_MONOTONIC time.
 *
 * Returns:
 *   Nanoseconds still to wait, 0 once PIXTEND_CYCLE_GAP_MS have passed.
 *   Never more than the full gap.
 *
 * Example:
 *   last = {100, 990000000}, now = {101, 5000000}  // => 15000000
 */
int64_t pixtend_cycle_wait_ns (const struct timespec *last,
                               const struct timespec *now);

class SpiTransport : public Transport
{
  struct pixtend_spi_config m_cfg;
  int m_spi_fd;
  int m_dac_fd;
  int m_enable_fd;
  bool m_have_cycle;
  struct timespec m_last_cycle;

  int claim_enable_line ();
  int open_device (const char *path, int *fd);
  void wait_cycle_gap ();

public:
  explicit SpiTransport (const struct pixtend_spi_config *cfg);
  ~SpiTransport ();

  SpiTransport (const SpiTransport &) = delete;
  SpiTransport &operator= (const SpiTransport &) = delete;

  int open () override;
  void close () override;
  int exchange (const uint8_t *tx, size_t tx_len,
                uint8_t *rx, size_t rx_size, size_t *rx_len) override;
  int write_dac (const uint8_t *word, size_t len) override;
};

#endif /* PIXTEND_SPI_TRANSPORT_H */
