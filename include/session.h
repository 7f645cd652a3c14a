/*
 * session.h -- Board session: the exchange cycle and typed I/O API
 *
 * A BoardSession owns a Transport, the pending output state and the
 * last validated input snapshot.  Setters only change the pending
 * state; read_write() pushes it to the board and replaces the snapshot;
 * getters read the snapshot.  Outputs latch: they are resent on every
 * cycle until changed.
 *
 * State machine:
 *
 *   DISCONNECTED --open()--> CONNECTED --read_write() ok--> SYNCHRONIZED
 *        ^                      |  ^                            |
 *        +------close()---------+  +---------open()---------- FAULTED
 *
 * A session is not safe for concurrent use.
 */

#ifndef PIXTEND_SESSION_H
#define PIXTEND_SESSION_H

#include <stddef.h>
#include <stdint.h>

#include "convert.h"
#include "protocol.h"
#include "transport.h"

#define PIXTEND_FAULT_THRESHOLD_DEFAULT  3

enum pixtend_session_state
{
  PIXTEND_DISCONNECTED = 0,
  PIXTEND_CONNECTED,
  PIXTEND_SYNCHRONIZED,
  PIXTEND_FAULTED
};

struct pixtend_session_config
{
  /* Consecutive failed exchanges before the session faults (>= 1) */
  unsigned fault_threshold;
};

/* Fill CFG with defaults. */
void pixtend_session_config_init (struct pixtend_session_config *cfg);

struct pixtend_board_status
{
  bool run;                /* false once the board entered its safe state */
  uint8_t error_code;      /* PIXTEND_BOARD_* of the last validated frame */
  uint8_t warnings;        /* PIXTEND_WARN_* */
  bool safe_requested;     /* SAFE bit was set in the frame that got this reply */
  bool watchdog_expired;
};

/* Human-readable name of a session state. */
const char *pixtend_state_name (int state);

class BoardSession
{
  Transport &m_transport;
  unsigned m_fault_threshold;
  int m_state;
  unsigned m_fault_count;
  unsigned long m_sequence;

  struct pixtend_output m_output;
  double m_dac_volts[PIXTEND_NUM_ANALOG_OUT];
  int m_analog_mode[PIXTEND_NUM_ANALOG_IN];

  /* Host safemode */
  bool m_safemode;
  double m_safe_min[PIXTEND_NUM_ANALOG_OUT];
  double m_safe_max[PIXTEND_NUM_ANALOG_OUT];
  uint16_t m_safe_digital;   /* bit n set: output n may be switched on */
  uint8_t m_safe_relay;
  uint8_t m_safe_gpio;

  /* Last validated snapshot and the settings of the frame that got it */
  bool m_have_input;
  struct pixtend_input m_input;
  uint8_t m_input_watchdog;
  bool m_input_safe;

  uint8_t m_tx[PIXTEND_FRAME_LEN];
  uint8_t m_rx[2 * PIXTEND_FRAME_LEN];

  int fail (int rc);
  int push_dac ();
  int check_pending_safe () const;
  int check_snapshot () const;
  uint8_t output_gpio_levels () const;

public:
  explicit BoardSession (Transport &transport,
                         const struct pixtend_session_config *cfg = NULL);
  ~BoardSession ();

  BoardSession (const BoardSession &) = delete;
  BoardSession &operator= (const BoardSession &) = delete;

  int open ();
  void close ();
  int read_write ();

  /* Outputs */
  int set_digital_output (unsigned channel, bool on);
  int set_relay_output (unsigned channel, bool on);
  int set_gpio_mode (unsigned channel, int mode);
  int set_gpio_output (unsigned channel, bool on);
  int set_analog_output (unsigned channel, double volts);
  int disable_analog_output (unsigned channel);
  int set_pwm_config (unsigned group, int mode, int prescaler,
                      bool enable_a, bool enable_b, uint16_t ctrl1);
  int set_pwm_value (unsigned group, unsigned channel, uint16_t value);
  int set_di_debounce (unsigned group, uint8_t cycles);
  int set_gpio_debounce (unsigned group, uint8_t cycles);
  int write_retain (const uint8_t *data, size_t len);

  /* Configuration */
  int set_safemode (bool enable);
  int set_analog_safe_bounds (unsigned channel, double min_volts,
                              double max_volts);
  int set_digital_safe (unsigned channel, bool allow_on);
  int set_relay_safe (unsigned channel, bool allow_on);
  int set_gpio_safe (unsigned channel, bool allow_on);
  int set_watchdog_period (int period);
  int set_analog_input_mode (unsigned channel, int mode);
  void set_retain_enable (bool enable);
  void set_retain_copy (bool enable);
  void set_led_disable (bool disable);
  int set_gpio_pullup_enable (bool enable);
  void request_safe_state (bool request);

  /* Inputs, read from the last validated snapshot */
  int read_digital_input (unsigned channel, bool *on) const;
  int read_analog_input (unsigned channel, double *value) const;
  int read_analog_raw (unsigned channel, uint16_t *raw) const;
  int read_gpio_input (unsigned channel, bool *on) const;
  int read_sensor (unsigned channel, int kind,
                   struct pixtend_sensor_reading *reading) const;
  int read_retain (uint8_t *data, size_t len) const;
  int firmware_version (uint8_t *version) const;
  int hardware_version (uint8_t *version) const;
  int board_model (uint8_t *model) const;
  int board_status (struct pixtend_board_status *status) const;

  int state () const { return m_state; }
  unsigned fault_count () const { return m_fault_count; }
  unsigned long sequence () const { return m_sequence; }
  bool safemode () const { return m_safemode; }
  const struct pixtend_output &pending_output () const { return m_output; }
};

#endif /* PIXTEND_SESSION_H */
