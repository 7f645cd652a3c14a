/*
 * pixtend-monitor -- PiXtend V2 -L- input monitor over SPI
 *
 * Exchanges frames with the board at the configured poll interval and
 * prints digital and analog inputs after every cycle, board status every
 * tenth cycle.  All outputs stay off.  If a watchdog period is
 * configured the board stops (status LED flashes) once this program
 * exits or stalls; it then needs a power cycle.
 *
 * Wiring: PiXtend V2 -L- on the Raspberry Pi header.  The microcontroller
 * sits on SPI0 CE0, the DAC on SPI0 CE1, SPI enable on GPIO 24.
 *
 * Stop with Ctrl-C.
 */

#include <signal.h>
#include <stdio.h>
#include <string.h>

#include "app.h"
#include "config.h"
#include "errors.h"
#include "log.h"
#include "spi_transport.h"

static_assert (sizeof (config_spi_device)
               == sizeof (((struct pixtend_spi_config *) 0)->device),
               "config paths must fit the SPI config");

static volatile sig_atomic_t stop_requested = 0;

static void
handle_signal (int)
{
  stop_requested = 1;
}

class MonitorApp : public BoardApp
{
  void on_init () override;
  void on_cycle () override;

public:
  MonitorApp (Transport &transport, const struct pixtend_session_config *cfg)
    : BoardApp (transport, cfg, config_poll_ms)
  {
  }
};

void
MonitorApp::on_init ()
{
  printf ("pixtend-monitor starting\n");
  printf ("SPI: %s @ %lu Hz, DAC: %s, enable: %s line %u\n",
          config_spi_device, (unsigned long) config_spi_speed,
          config_dac_device, config_gpio_chip, config_enable_line);
  printf ("Poll: %u ms, watchdog code: %u, fault threshold: %u\n",
          config_poll_ms, config_watchdog, config_fault_threshold);

  int rc = m_session.set_watchdog_period (config_watchdog);
  if (rc != PIXTEND_OK)
    log_error ("set_watchdog_period", rc);
}

void
MonitorApp::on_cycle ()
{
  if (m_cycles % 10 == 1)
    log_status (m_session);
  log_inputs (m_session);
}

int
main (void)
{
  int rc = config_init ();
  if (rc != PIXTEND_OK)
    log_error ("config_init", rc);

  struct pixtend_spi_config spi_cfg;
  pixtend_spi_config_init (&spi_cfg);
  memcpy (spi_cfg.device, config_spi_device, sizeof (spi_cfg.device));
  memcpy (spi_cfg.dac_device, config_dac_device, sizeof (spi_cfg.dac_device));
  memcpy (spi_cfg.gpio_chip, config_gpio_chip, sizeof (spi_cfg.gpio_chip));
  spi_cfg.enable_line = config_enable_line;
  spi_cfg.speed_hz = config_spi_speed;

  struct pixtend_session_config session_cfg;
  pixtend_session_config_init (&session_cfg);
  session_cfg.fault_threshold = config_fault_threshold;

  signal (SIGINT, handle_signal);
  signal (SIGTERM, handle_signal);

  SpiTransport transport (&spi_cfg);
  MonitorApp app (transport, &session_cfg);

  app.setup ();
  while (!stop_requested)
    app.loop ();

  printf ("pixtend-monitor stopped\n");
  return 0;
}
