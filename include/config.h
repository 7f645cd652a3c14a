/*
 * config.h -- Binary-patchable configuration for pixtend-monitor
 *
 * Marker arrays are initialized with @@MARKER_XXXX@@ strings at compile
 * time.  A deploy step may overwrite these markers with real values in
 * the installed binary.
 *
 * config_init() reads the (possibly patched) marker arrays into the
 * config_* variables.  Markers left unpatched fall back to the board's
 * documented defaults.
 */

#ifndef PIXTEND_CONFIG_H
#define PIXTEND_CONFIG_H

#include <stdint.h>

#include "spi_transport.h"

/* Paths end up in struct pixtend_spi_config, so they share its size */
#define CONFIG_PATH_LEN  PIXTEND_SPI_PATH_LEN

/* Parsed configuration -- set by config_init() */
extern char     config_spi_device[CONFIG_PATH_LEN];
extern char     config_dac_device[CONFIG_PATH_LEN];
extern char     config_gpio_chip[CONFIG_PATH_LEN];
extern uint8_t  config_enable_line;
extern uint32_t config_spi_speed;
extern uint16_t config_poll_ms;
extern uint8_t  config_watchdog;
extern uint8_t  config_fault_threshold;

/*
 * config_init -- Load patched values over the defaults.
 *
 * Returns:
 *   PIXTEND_OK, or PIXTEND_ERR_OUT_OF_RANGE if a patched value was
 *   rejected (path without a terminator inside CONFIG_PATH_LEN bytes,
 *   unknown watchdog code, zero fault threshold).  Rejected values keep
 *   their defaults; the others are still applied.
 */
int config_init (void);

#endif /* PIXTEND_CONFIG_H */
