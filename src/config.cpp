/*
 * config.cpp -- Binary-patchable configuration for pixtend-monitor
 *
 * Marker arrays contain @@MARKER_XXXX@@ strings in an unpatched binary.
 * A patcher overwrites the marker region with real values (binary for
 * numerics, null-terminated for strings).
 *
 * config_init() reads the patched bytes into config_* variables.
 */

#include "config.h"

#include <string.h>

#include "errors.h"
#include "protocol.h"
#include "session.h"
#include "spi_transport.h"

/*
 * Marker arrays -- patcher finds these by byte pattern and overwrites.
 * Each @@MARKER_XXXX@@ is 15 chars + null = 16 bytes.
 *
 * Numeric fields: patcher writes raw little-endian binary.
 * String fields: patcher writes null-terminated string + null padding.
 */
char    config_spid_buf[CONFIG_PATH_LEN] = "@@MARKER_SPID@@";
char    config_dacd_buf[CONFIG_PATH_LEN] = "@@MARKER_DACD@@";
char    config_gpio_buf[CONFIG_PATH_LEN] = "@@MARKER_GPIO@@";
uint8_t config_line[16] = "@@MARKER_LINE@@";
uint8_t config_freq[16] = "@@MARKER_FREQ@@";
uint8_t config_poll[16] = "@@MARKER_POLL@@";
uint8_t config_wdog[16] = "@@MARKER_WDOG@@";
uint8_t config_flts[16] = "@@MARKER_FLTS@@";

/* Parsed configuration */
char     config_spi_device[CONFIG_PATH_LEN] = "/dev/spidev0.0";
char     config_dac_device[CONFIG_PATH_LEN] = "/dev/spidev0.1";
char     config_gpio_chip[CONFIG_PATH_LEN]  = "/dev/gpiochip0";
uint8_t  config_enable_line     = PIXTEND_SPI_ENABLE_LINE;
uint32_t config_spi_speed       = PIXTEND_SPI_SPEED_HZ;
uint16_t config_poll_ms         = 100;
uint8_t  config_watchdog        = PIXTEND_WATCHDOG_OFF;
uint8_t  config_fault_threshold = PIXTEND_FAULT_THRESHOLD_DEFAULT;

static const char MARKER_PREFIX[] = "@@MARKER_";

static bool
patched (const void *buf)
{
  return memcmp (buf, MARKER_PREFIX, sizeof (MARKER_PREFIX) - 1) != 0;
}

/* A path that fills the whole buffer has no room for its terminator. */
static int
copy_path (char *dst, const char *src)
{
  if (!patched (src) || src[0] == '\0')
    return PIXTEND_OK;
  if (memchr (src, '\0', CONFIG_PATH_LEN) == NULL)
    return PIXTEND_ERR_OUT_OF_RANGE;
  memcpy (dst, src, CONFIG_PATH_LEN);
  return PIXTEND_OK;
}

/*
 * config_init -- Parse patched marker arrays into config variables.
 *
 * For line/wdog/flts: byte 0 holds the value.
 * For freq: bytes 0-3 hold a little-endian uint32 (Hz).
 * For poll: bytes 0-1 hold a little-endian uint16 (ms).
 * For paths: null-terminated value copied from marker buffer.
 *
 * Rejected values keep their defaults.
 */
int
config_init (void)
{
  int rc = PIXTEND_OK;

  if (copy_path (config_spi_device, config_spid_buf) != PIXTEND_OK)
    rc = PIXTEND_ERR_OUT_OF_RANGE;
  if (copy_path (config_dac_device, config_dacd_buf) != PIXTEND_OK)
    rc = PIXTEND_ERR_OUT_OF_RANGE;
  if (copy_path (config_gpio_chip, config_gpio_buf) != PIXTEND_OK)
    rc = PIXTEND_ERR_OUT_OF_RANGE;

  if (patched (config_line))
    config_enable_line = config_line[0];
  if (patched (config_freq))
    config_spi_speed = (uint32_t) config_freq[0]
                       | ((uint32_t) config_freq[1] << 8)
                       | ((uint32_t) config_freq[2] << 16)
                       | ((uint32_t) config_freq[3] << 24);
  if (patched (config_poll))
    config_poll_ms = (uint16_t) (config_poll[0] | (config_poll[1] << 8));
  if (patched (config_wdog))
    {
      if (config_wdog[0] <= PIXTEND_WATCHDOG_MAX)
        config_watchdog = config_wdog[0];
      else
        rc = PIXTEND_ERR_OUT_OF_RANGE;
    }
  if (patched (config_flts))
    {
      if (config_flts[0] > 0)
        config_fault_threshold = config_flts[0];
      else
        rc = PIXTEND_ERR_OUT_OF_RANGE;
    }
  return rc;
}
