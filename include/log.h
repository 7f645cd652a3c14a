/*
 * log.h -- Console logging helpers for pixtend-monitor
 *
 * Inline functions for logging board state to stdout and errors to
 * stderr.
 */

#ifndef PIXTEND_LOG_H
#define PIXTEND_LOG_H

#include <stdio.h>

#include "errors.h"
#include "session.h"

/*
 * log_error -- Log a failed call: "read_write: checksum mismatch (-20)"
 */
static inline void
log_error (const char *label, int rc)
{
  fprintf (stderr, "%s: %s (%d)\n", label, pixtend_strerror (rc), rc);
}

/*
 * log_digital -- Log a channel bitmask, channel 0 first.
 *
 * Prints e.g. DI=[1000000000000001]
 */
static inline void
log_digital (const char *label, uint16_t bits, unsigned count)
{
  printf ("%s=[", label);
  for (unsigned i = 0; i < count; i++)
    putchar ((bits >> i) & 1 ? '1' : '0');
  printf ("]");
}

/*
 * log_inputs -- Log digital and analog inputs of the last snapshot.
 *
 * Prints e.g. DI=[0100000000000000] AI=[5.00V, 0.00V, 9.99V, 0.00V,
 * 4.01mA, 0.00mA]
 */
static inline void
log_inputs (const BoardSession &session)
{
  uint16_t bits = 0;
  for (unsigned ch = 0; ch < PIXTEND_NUM_DIGITAL_IN; ch++)
    {
      bool on;
      if (session.read_digital_input (ch, &on) == PIXTEND_OK && on)
        bits |= (uint16_t) (1u << ch);
    }
  log_digital ("DI", bits, PIXTEND_NUM_DIGITAL_IN);

  printf (" AI=[");
  for (unsigned ch = 0; ch < PIXTEND_NUM_ANALOG_IN; ch++)
    {
      double value;
      if (ch > 0)
        printf (", ");
      if (session.read_analog_input (ch, &value) != PIXTEND_OK)
        printf ("--.--");
      else
        printf ("%.2f%s", value, ch < PIXTEND_NUM_VOLTAGE_IN ? "V" : "mA");
    }
  printf ("]\n");
}

/*
 * log_status -- Log board versions and state.
 *
 * Prints e.g. fw=1 hw=21 run=1 err=0 warn=0x00 seq=42
 */
static inline void
log_status (const BoardSession &session)
{
  uint8_t fw = 0, hw = 0;
  struct pixtend_board_status st;

  if (session.firmware_version (&fw) != PIXTEND_OK
      || session.hardware_version (&hw) != PIXTEND_OK
      || session.board_status (&st) != PIXTEND_OK)
    {
      printf ("state=%s (no snapshot)\n", pixtend_state_name (session.state ()));
      return;
    }
  printf ("fw=%u hw=%u run=%d err=%u warn=0x%02x seq=%lu%s\n", fw, hw,
          st.run ? 1 : 0, st.error_code, st.warnings, session.sequence (),
          st.watchdog_expired ? " WATCHDOG EXPIRED" : "");
}

#endif /* PIXTEND_LOG_H */
