/*
 * session.cpp -- Board session: the exchange cycle and typed I/O API
 */

#include "session.h"

#include <string.h>

#include "errors.h"

#define DIGITAL_OUT_MASK  ((uint16_t) ((1u << PIXTEND_NUM_DIGITAL_OUT) - 1))
#define RELAY_MASK        ((uint8_t) ((1u << PIXTEND_NUM_RELAYS) - 1))
#define GPIO_MASK         ((uint8_t) ((1u << PIXTEND_NUM_GPIO) - 1))

void
pixtend_session_config_init (struct pixtend_session_config *cfg)
{
  cfg->fault_threshold = PIXTEND_FAULT_THRESHOLD_DEFAULT;
}

const char *
pixtend_state_name (int state)
{
  switch (state)
    {
    case PIXTEND_DISCONNECTED:
      return "disconnected";
    case PIXTEND_CONNECTED:
      return "connected";
    case PIXTEND_SYNCHRONIZED:
      return "synchronized";
    case PIXTEND_FAULTED:
      return "faulted";
    default:
      return "unknown";
    }
}

/* Map the board's error nibble to a status code. */
static int
board_error (uint8_t code)
{
  switch (code)
    {
    case PIXTEND_BOARD_OK:
      return PIXTEND_OK;
    case PIXTEND_BOARD_DATA_CRC:
    case PIXTEND_BOARD_HEADER_CRC:
      return PIXTEND_ERR_BOARD_CRC;
    case PIXTEND_BOARD_DATA_SHORT:
      return PIXTEND_ERR_BOARD_FRAME_SHORT;
    case PIXTEND_BOARD_MODEL:
      return PIXTEND_ERR_BOARD_MODEL;
    case PIXTEND_BOARD_SPI_SPEED:
      return PIXTEND_ERR_BOARD_SPI_SPEED;
    default:
      return PIXTEND_ERR_BOARD_FAULT;
    }
}

BoardSession::BoardSession (Transport &transport,
                            const struct pixtend_session_config *cfg)
  : m_transport (transport),
    m_fault_threshold (PIXTEND_FAULT_THRESHOLD_DEFAULT),
    m_state (PIXTEND_DISCONNECTED),
    m_fault_count (0),
    m_sequence (0),
    m_safemode (false),
    m_safe_digital (DIGITAL_OUT_MASK),
    m_safe_relay (RELAY_MASK),
    m_safe_gpio (GPIO_MASK),
    m_have_input (false),
    m_input_watchdog (PIXTEND_WATCHDOG_OFF),
    m_input_safe (false)
{
  if (cfg != NULL)
    m_fault_threshold = cfg->fault_threshold > 0 ? cfg->fault_threshold : 1;

  pixtend_output_init (&m_output);
  pixtend_input_init (&m_input);
  for (unsigned ch = 0; ch < PIXTEND_NUM_ANALOG_OUT; ch++)
    {
      m_dac_volts[ch] = 0.0;
      m_safe_min[ch] = 0.0;
      m_safe_max[ch] = PIXTEND_ANALOG_OUT_MAX_V;
    }
  for (unsigned ch = 0; ch < PIXTEND_NUM_ANALOG_IN; ch++)
    m_analog_mode[ch] = pixtend_analog_default_mode (ch);
  memset (m_tx, 0, sizeof (m_tx));
  memset (m_rx, 0, sizeof (m_rx));
}

BoardSession::~BoardSession ()
{
  m_transport.close ();
}

/*
 * BoardSession::open -- Claim the transport.
 *
 * Also the recovery path out of FAULTED: the transport is reclaimed and
 * the snapshot, fault counter and sequence count start over.  Pending
 * outputs are kept.
 *
 * Returns:
 *   PIXTEND_OK, or the transport's error (state becomes DISCONNECTED).
 */
int
BoardSession::open ()
{
  m_have_input = false;
  m_fault_count = 0;
  m_sequence = 0;

  if (m_state != PIXTEND_DISCONNECTED)
    m_transport.close ();
  int rc = m_transport.open ();
  if (rc != PIXTEND_OK)
    {
      m_state = PIXTEND_DISCONNECTED;
      return rc;
    }
  m_state = PIXTEND_CONNECTED;
  return PIXTEND_OK;
}

void
BoardSession::close ()
{
  m_transport.close ();
  m_state = PIXTEND_DISCONNECTED;
}

/*
 * Count a failed exchange.  Transport errors fault the session as soon
 * as the threshold is reached; integrity and board errors never fault
 * on the first failure of a run.
 */
int
BoardSession::fail (int rc)
{
  m_fault_count++;
  if (m_fault_count >= m_fault_threshold
      && (pixtend_is_transport_error (rc) || m_fault_count > 1))
    m_state = PIXTEND_FAULTED;
  return rc;
}

int
BoardSession::push_dac ()
{
  uint8_t word[PIXTEND_DAC_WORD_LEN];

  for (unsigned ch = 0; ch < PIXTEND_NUM_ANALOG_OUT; ch++)
    {
      pixtend_encode_dac (ch, &m_output.dac[ch], word);
      int rc = m_transport.write_dac (word, sizeof (word));
      if (rc != PIXTEND_OK)
        return rc;
    }
  return PIXTEND_OK;
}

/*
 * BoardSession::read_write -- Run one exchange cycle.
 *
 * Writes both DAC words, then swaps the encoded output frame for the
 * board's input frame.  The snapshot is replaced only when the reply has
 * the right length, valid CRCs, model 'L' and no board error.
 *
 * Returns:
 *   PIXTEND_OK on success.
 *   PIXTEND_ERR_NOT_OPEN, PIXTEND_ERR_SESSION_FAULTED or
 *   PIXTEND_ERR_BOARD_NOT_RUNNING without touching the bus.
 *   A transport, integrity or board error otherwise; each one counts
 *   towards the fault threshold.
 */
int
BoardSession::read_write ()
{
  if (m_state == PIXTEND_DISCONNECTED)
    return PIXTEND_ERR_NOT_OPEN;
  if (m_state == PIXTEND_FAULTED)
    return PIXTEND_ERR_SESSION_FAULTED;
  if (m_have_input && !m_input.run)
    return PIXTEND_ERR_BOARD_NOT_RUNNING;

  m_sequence++;

  int rc = push_dac ();
  if (rc != PIXTEND_OK)
    return fail (rc);

  pixtend_encode_output (&m_output, m_tx);
  size_t rx_len = 0;
  rc = m_transport.exchange (m_tx, sizeof (m_tx), m_rx, sizeof (m_rx),
                             &rx_len);
  if (rc != PIXTEND_OK)
    return fail (rc);

  struct pixtend_input in;
  rc = pixtend_decode_input (m_rx, rx_len, &in);
  if (rc != PIXTEND_OK)
    return fail (rc);
  if (in.model != PIXTEND_MODEL_L)
    return fail (PIXTEND_ERR_MODEL_MISMATCH);
  rc = board_error (in.error_code);
  if (rc != PIXTEND_OK)
    return fail (rc);

  m_input = in;
  m_have_input = true;
  m_input_watchdog = m_output.watchdog;
  m_input_safe = (m_output.system & PIXTEND_SYS_SAFE) != 0;
  m_fault_count = 0;
  m_state = PIXTEND_SYNCHRONIZED;
  return PIXTEND_OK;
}

/* -- Safemode ------------------------------------------------------------- */

uint8_t
BoardSession::output_gpio_levels () const
{
  uint8_t levels = 0;
  for (unsigned ch = 0; ch < PIXTEND_NUM_GPIO; ch++)
    if (m_output.gpio_mode[ch] == PIXTEND_GPIO_OUTPUT)
      levels |= m_output.gpio_level & (1u << ch);
  return levels;
}

/* UNSAFE_VALUE if any pending output lies outside its safe bound. */
int
BoardSession::check_pending_safe () const
{
  if (m_output.digital_out & ~m_safe_digital)
    return PIXTEND_ERR_UNSAFE_VALUE;
  if (m_output.relay_out & ~m_safe_relay)
    return PIXTEND_ERR_UNSAFE_VALUE;
  if (output_gpio_levels () & ~m_safe_gpio)
    return PIXTEND_ERR_UNSAFE_VALUE;

  for (unsigned ch = 0; ch < PIXTEND_NUM_ANALOG_OUT; ch++)
    if (m_output.dac[ch].enabled
        && (m_dac_volts[ch] < m_safe_min[ch]
            || m_dac_volts[ch] > m_safe_max[ch]))
      return PIXTEND_ERR_UNSAFE_VALUE;
  return PIXTEND_OK;
}

/*
 * BoardSession::set_safemode -- Turn host-side safe bounds on or off.
 *
 * This does not touch the board's SAFE bit (see request_safe_state).
 *
 * Returns:
 *   PIXTEND_OK, or PIXTEND_ERR_UNSAFE_VALUE when enabling while a pending
 *   output already violates its bound.
 */
int
BoardSession::set_safemode (bool enable)
{
  if (enable)
    {
      int rc = check_pending_safe ();
      if (rc != PIXTEND_OK)
        return rc;
    }
  m_safemode = enable;
  return PIXTEND_OK;
}

int
BoardSession::set_analog_safe_bounds (unsigned channel, double min_volts,
                                      double max_volts)
{
  if (channel >= PIXTEND_NUM_ANALOG_OUT)
    return PIXTEND_ERR_INVALID_CHANNEL;
  if (!(min_volts >= 0.0 && max_volts <= PIXTEND_ANALOG_OUT_MAX_V
        && min_volts <= max_volts))
    return PIXTEND_ERR_OUT_OF_RANGE;

  if (m_safemode && m_output.dac[channel].enabled
      && (m_dac_volts[channel] < min_volts
          || m_dac_volts[channel] > max_volts))
    return PIXTEND_ERR_UNSAFE_VALUE;

  m_safe_min[channel] = min_volts;
  m_safe_max[channel] = max_volts;
  return PIXTEND_OK;
}

int
BoardSession::set_digital_safe (unsigned channel, bool allow_on)
{
  if (channel >= PIXTEND_NUM_DIGITAL_OUT)
    return PIXTEND_ERR_INVALID_CHANNEL;

  uint16_t bit = (uint16_t) (1u << channel);
  if (allow_on)
    m_safe_digital |= bit;
  else
    {
      if (m_safemode && (m_output.digital_out & bit))
        return PIXTEND_ERR_UNSAFE_VALUE;
      m_safe_digital &= (uint16_t) ~bit;
    }
  return PIXTEND_OK;
}

int
BoardSession::set_relay_safe (unsigned channel, bool allow_on)
{
  if (channel >= PIXTEND_NUM_RELAYS)
    return PIXTEND_ERR_INVALID_CHANNEL;

  uint8_t bit = (uint8_t) (1u << channel);
  if (allow_on)
    m_safe_relay |= bit;
  else
    {
      if (m_safemode && (m_output.relay_out & bit))
        return PIXTEND_ERR_UNSAFE_VALUE;
      m_safe_relay &= (uint8_t) ~bit;
    }
  return PIXTEND_OK;
}

int
BoardSession::set_gpio_safe (unsigned channel, bool allow_on)
{
  if (channel >= PIXTEND_NUM_GPIO)
    return PIXTEND_ERR_INVALID_CHANNEL;

  uint8_t bit = (uint8_t) (1u << channel);
  if (allow_on)
    m_safe_gpio |= bit;
  else
    {
      if (m_safemode && (output_gpio_levels () & bit))
        return PIXTEND_ERR_UNSAFE_VALUE;
      m_safe_gpio &= (uint8_t) ~bit;
    }
  return PIXTEND_OK;
}

/* -- Output setters ------------------------------------------------------- */

int
BoardSession::set_digital_output (unsigned channel, bool on)
{
  if (channel >= PIXTEND_NUM_DIGITAL_OUT)
    return PIXTEND_ERR_INVALID_CHANNEL;

  uint16_t bit = (uint16_t) (1u << channel);
  if (on && m_safemode && !(m_safe_digital & bit))
    return PIXTEND_ERR_UNSAFE_VALUE;

  if (on)
    m_output.digital_out |= bit;
  else
    m_output.digital_out &= (uint16_t) ~bit;
  return PIXTEND_OK;
}

int
BoardSession::set_relay_output (unsigned channel, bool on)
{
  if (channel >= PIXTEND_NUM_RELAYS)
    return PIXTEND_ERR_INVALID_CHANNEL;

  uint8_t bit = (uint8_t) (1u << channel);
  if (on && m_safemode && !(m_safe_relay & bit))
    return PIXTEND_ERR_UNSAFE_VALUE;

  if (on)
    m_output.relay_out |= bit;
  else
    m_output.relay_out &= (uint8_t) ~bit;
  return PIXTEND_OK;
}

/*
 * BoardSession::set_gpio_mode -- Configure a GPIO.
 *
 * Leaving output mode drives the pin's pending level low.
 *
 * Returns:
 *   PIXTEND_OK, PIXTEND_ERR_INVALID_CHANNEL, PIXTEND_ERR_INVALID_MODE for
 *   an unknown mode, or PIXTEND_ERR_PULLUP_DISABLED when asking for a
 *   pull-up while the global pull-up enable is off.
 */
int
BoardSession::set_gpio_mode (unsigned channel, int mode)
{
  if (channel >= PIXTEND_NUM_GPIO)
    return PIXTEND_ERR_INVALID_CHANNEL;
  if (mode < PIXTEND_GPIO_INPUT || mode > PIXTEND_GPIO_SENSOR)
    return PIXTEND_ERR_INVALID_MODE;
  if (mode == PIXTEND_GPIO_INPUT_PULLUP
      && !(m_output.system & PIXTEND_SYS_GPIO_PULLUP))
    return PIXTEND_ERR_PULLUP_DISABLED;

  m_output.gpio_mode[channel] = (uint8_t) mode;
  if (mode != PIXTEND_GPIO_OUTPUT)
    m_output.gpio_level &= (uint8_t) ~(1u << channel);
  return PIXTEND_OK;
}

int
BoardSession::set_gpio_output (unsigned channel, bool on)
{
  if (channel >= PIXTEND_NUM_GPIO)
    return PIXTEND_ERR_INVALID_CHANNEL;
  if (m_output.gpio_mode[channel] != PIXTEND_GPIO_OUTPUT)
    return PIXTEND_ERR_INVALID_MODE;

  uint8_t bit = (uint8_t) (1u << channel);
  if (on && m_safemode && !(m_safe_gpio & bit))
    return PIXTEND_ERR_UNSAFE_VALUE;

  if (on)
    m_output.gpio_level |= bit;
  else
    m_output.gpio_level &= (uint8_t) ~bit;
  return PIXTEND_OK;
}

/*
 * BoardSession::set_analog_output -- Drive a DAC channel to VOLTS.
 *
 * Enables the channel.  Range is checked before the safe bound.
 *
 * Returns:
 *   PIXTEND_OK, PIXTEND_ERR_INVALID_CHANNEL, PIXTEND_ERR_OUT_OF_RANGE
 *   (outside 0..10 V or NaN) or PIXTEND_ERR_UNSAFE_VALUE.
 */
int
BoardSession::set_analog_output (unsigned channel, double volts)
{
  if (channel >= PIXTEND_NUM_ANALOG_OUT)
    return PIXTEND_ERR_INVALID_CHANNEL;

  uint16_t raw;
  int rc = pixtend_volts_to_dac (volts, &raw);
  if (rc != PIXTEND_OK)
    return rc;
  if (m_safemode
      && (volts < m_safe_min[channel] || volts > m_safe_max[channel]))
    return PIXTEND_ERR_UNSAFE_VALUE;

  m_output.dac[channel].enabled = true;
  m_output.dac[channel].value = raw;
  m_dac_volts[channel] = volts;
  return PIXTEND_OK;
}

int
BoardSession::disable_analog_output (unsigned channel)
{
  if (channel >= PIXTEND_NUM_ANALOG_OUT)
    return PIXTEND_ERR_INVALID_CHANNEL;
  m_output.dac[channel].enabled = false;
  return PIXTEND_OK;
}

/*
 * BoardSession::set_pwm_config -- Configure one PWM group.
 *
 * Servo mode runs from the fixed servo clock, so it takes neither a
 * prescaler nor ctrl1.  Frequency mode takes a prescaler but no ctrl1.
 * Both channel values of the group are reset to 0.
 *
 * Returns:
 *   PIXTEND_OK, PIXTEND_ERR_INVALID_CHANNEL, PIXTEND_ERR_OUT_OF_RANGE for
 *   an unknown prescaler, or PIXTEND_ERR_INVALID_MODE for an unknown mode
 *   or a prescaler/ctrl1 the mode does not use.
 */
int
BoardSession::set_pwm_config (unsigned group, int mode, int prescaler,
                              bool enable_a, bool enable_b, uint16_t ctrl1)
{
  if (group >= PIXTEND_NUM_PWM_GROUPS)
    return PIXTEND_ERR_INVALID_CHANNEL;
  if (mode < PIXTEND_PWM_SERVO || mode > PIXTEND_PWM_MODE_MAX)
    return PIXTEND_ERR_INVALID_MODE;
  if (prescaler < PIXTEND_PWM_PRESCALE_OFF
      || prescaler > PIXTEND_PWM_PRESCALE_MAX)
    return PIXTEND_ERR_OUT_OF_RANGE;
  if (mode == PIXTEND_PWM_SERVO
      && (prescaler != PIXTEND_PWM_PRESCALE_OFF || ctrl1 != 0))
    return PIXTEND_ERR_INVALID_MODE;
  if (mode == PIXTEND_PWM_FREQUENCY && ctrl1 != 0)
    return PIXTEND_ERR_INVALID_MODE;

  struct pixtend_pwm_group *pwm = &m_output.pwm[group];
  pwm->mode = (uint8_t) mode;
  pwm->prescaler = (uint8_t) prescaler;
  pwm->enable[0] = enable_a;
  pwm->enable[1] = enable_b;
  pwm->ctrl1 = ctrl1;
  pwm->value[0] = 0;
  pwm->value[1] = 0;
  return PIXTEND_OK;
}

int
BoardSession::set_pwm_value (unsigned group, unsigned channel, uint16_t value)
{
  if (group >= PIXTEND_NUM_PWM_GROUPS || channel >= PIXTEND_PWM_CHANNELS)
    return PIXTEND_ERR_INVALID_CHANNEL;
  m_output.pwm[group].value[channel] = value;
  return PIXTEND_OK;
}

int
BoardSession::set_di_debounce (unsigned group, uint8_t cycles)
{
  if (group >= PIXTEND_NUM_DI_DEBOUNCE)
    return PIXTEND_ERR_INVALID_CHANNEL;
  m_output.di_debounce[group] = cycles;
  return PIXTEND_OK;
}

int
BoardSession::set_gpio_debounce (unsigned group, uint8_t cycles)
{
  if (group >= PIXTEND_NUM_GPIO_DEBOUNCE)
    return PIXTEND_ERR_INVALID_CHANNEL;
  m_output.gpio_debounce[group] = cycles;
  return PIXTEND_OK;
}

/*
 * BoardSession::write_retain -- Queue a block for the board's retain
 * memory.  Blocks shorter than PIXTEND_RETAIN_LEN are zero-padded.
 *
 * Returns:
 *   PIXTEND_OK, PIXTEND_ERR_RETAIN_DISABLED or PIXTEND_ERR_OUT_OF_RANGE
 *   (len > PIXTEND_RETAIN_LEN).
 */
int
BoardSession::write_retain (const uint8_t *data, size_t len)
{
  if (!(m_output.system & PIXTEND_SYS_RETAIN_ENABLE))
    return PIXTEND_ERR_RETAIN_DISABLED;
  if (len > PIXTEND_RETAIN_LEN)
    return PIXTEND_ERR_OUT_OF_RANGE;

  memset (m_output.retain, 0, sizeof (m_output.retain));
  if (len > 0)
    memcpy (m_output.retain, data, len);
  return PIXTEND_OK;
}

/* -- Configuration -------------------------------------------------------- */

int
BoardSession::set_watchdog_period (int period)
{
  if (period < PIXTEND_WATCHDOG_OFF || period > PIXTEND_WATCHDOG_MAX)
    return PIXTEND_ERR_OUT_OF_RANGE;
  m_output.watchdog = (uint8_t) period;
  return PIXTEND_OK;
}

int
BoardSession::set_analog_input_mode (unsigned channel, int mode)
{
  int rc = pixtend_analog_mode_check (channel, mode);
  if (rc != PIXTEND_OK)
    return rc;
  m_analog_mode[channel] = mode;
  return PIXTEND_OK;
}

static void
set_system_bit (uint8_t *system, uint8_t bit, bool on)
{
  if (on)
    *system |= bit;
  else
    *system &= (uint8_t) ~bit;
}

void
BoardSession::set_retain_enable (bool enable)
{
  set_system_bit (&m_output.system, PIXTEND_SYS_RETAIN_ENABLE, enable);
}

void
BoardSession::set_retain_copy (bool enable)
{
  set_system_bit (&m_output.system, PIXTEND_SYS_RETAIN_COPY, enable);
}

void
BoardSession::set_led_disable (bool disable)
{
  set_system_bit (&m_output.system, PIXTEND_SYS_LED_DISABLE, disable);
}

/*
 * BoardSession::set_gpio_pullup_enable -- Global GPIO pull-up switch.
 *
 * Returns:
 *   PIXTEND_OK, or PIXTEND_ERR_INVALID_MODE when disabling while a GPIO
 *   is configured as input with pull-up.
 */
int
BoardSession::set_gpio_pullup_enable (bool enable)
{
  if (!enable)
    for (unsigned ch = 0; ch < PIXTEND_NUM_GPIO; ch++)
      if (m_output.gpio_mode[ch] == PIXTEND_GPIO_INPUT_PULLUP)
        return PIXTEND_ERR_INVALID_MODE;

  set_system_bit (&m_output.system, PIXTEND_SYS_GPIO_PULLUP, enable);
  return PIXTEND_OK;
}

/*
 * BoardSession::request_safe_state -- Ask the board to enter its safe
 * state.  The board then clears RUN and stays there until power cycled.
 */
void
BoardSession::request_safe_state (bool request)
{
  set_system_bit (&m_output.system, PIXTEND_SYS_SAFE, request);
}

/* -- Input getters -------------------------------------------------------- */

int
BoardSession::check_snapshot () const
{
  return m_have_input ? PIXTEND_OK : PIXTEND_ERR_NOT_SYNCHRONIZED;
}

int
BoardSession::read_digital_input (unsigned channel, bool *on) const
{
  if (channel >= PIXTEND_NUM_DIGITAL_IN)
    return PIXTEND_ERR_INVALID_CHANNEL;
  int rc = check_snapshot ();
  if (rc != PIXTEND_OK)
    return rc;
  *on = (m_input.digital_in >> channel) & 1;
  return PIXTEND_OK;
}

/*
 * BoardSession::read_analog_input -- Analog input in physical units.
 *
 * Volts for channels 0-3, milliamps for 4-5, scaled according to the
 * channel's configured input mode.
 */
int
BoardSession::read_analog_input (unsigned channel, double *value) const
{
  if (channel >= PIXTEND_NUM_ANALOG_IN)
    return PIXTEND_ERR_INVALID_CHANNEL;
  int rc = check_snapshot ();
  if (rc != PIXTEND_OK)
    return rc;
  *value = pixtend_analog_in_value (m_input.analog_in[channel],
                                    m_analog_mode[channel]);
  return PIXTEND_OK;
}

int
BoardSession::read_analog_raw (unsigned channel, uint16_t *raw) const
{
  if (channel >= PIXTEND_NUM_ANALOG_IN)
    return PIXTEND_ERR_INVALID_CHANNEL;
  int rc = check_snapshot ();
  if (rc != PIXTEND_OK)
    return rc;
  *raw = m_input.analog_in[channel];
  return PIXTEND_OK;
}

int
BoardSession::read_gpio_input (unsigned channel, bool *on) const
{
  if (channel >= PIXTEND_NUM_GPIO)
    return PIXTEND_ERR_INVALID_CHANNEL;
  if (m_output.gpio_mode[channel] != PIXTEND_GPIO_INPUT
      && m_output.gpio_mode[channel] != PIXTEND_GPIO_INPUT_PULLUP)
    return PIXTEND_ERR_INVALID_MODE;
  int rc = check_snapshot ();
  if (rc != PIXTEND_OK)
    return rc;
  *on = (m_input.gpio_in >> channel) & 1;
  return PIXTEND_OK;
}

/*
 * BoardSession::read_sensor -- Decode the sensor attached to a GPIO.
 *
 * Returns:
 *   PIXTEND_OK, PIXTEND_ERR_INVALID_CHANNEL, PIXTEND_ERR_INVALID_MODE if
 *   the GPIO is not in sensor mode, PIXTEND_ERR_NOT_SYNCHRONIZED, or a
 *   sensor error from pixtend_sensor_decode.
 */
int
BoardSession::read_sensor (unsigned channel, int kind,
                           struct pixtend_sensor_reading *reading) const
{
  if (channel >= PIXTEND_NUM_SENSORS)
    return PIXTEND_ERR_INVALID_CHANNEL;
  if (m_output.gpio_mode[channel] != PIXTEND_GPIO_SENSOR)
    return PIXTEND_ERR_INVALID_MODE;
  int rc = check_snapshot ();
  if (rc != PIXTEND_OK)
    return rc;
  return pixtend_sensor_decode (m_input.sensor[channel].temperature,
                                m_input.sensor[channel].humidity, kind,
                                reading);
}

/* Copy the first LEN bytes of the board's retain memory into DATA. */
int
BoardSession::read_retain (uint8_t *data, size_t len) const
{
  if (len > PIXTEND_RETAIN_LEN)
    return PIXTEND_ERR_OUT_OF_RANGE;
  int rc = check_snapshot ();
  if (rc != PIXTEND_OK)
    return rc;
  if (len > 0)
    memcpy (data, m_input.retain, len);
  return PIXTEND_OK;
}

int
BoardSession::firmware_version (uint8_t *version) const
{
  int rc = check_snapshot ();
  if (rc == PIXTEND_OK)
    *version = m_input.firmware;
  return rc;
}

int
BoardSession::hardware_version (uint8_t *version) const
{
  int rc = check_snapshot ();
  if (rc == PIXTEND_OK)
    *version = m_input.hardware;
  return rc;
}

int
BoardSession::board_model (uint8_t *model) const
{
  int rc = check_snapshot ();
  if (rc == PIXTEND_OK)
    *model = m_input.model;
  return rc;
}

/*
 * BoardSession::board_status -- Board state of the last snapshot.
 *
 * watchdog_expired is derived: the board stopped running while the
 * frame that got this reply had a watchdog period set and did not
 * request the safe state.
 */
int
BoardSession::board_status (struct pixtend_board_status *status) const
{
  int rc = check_snapshot ();
  if (rc != PIXTEND_OK)
    return rc;

  status->run = m_input.run;
  status->error_code = m_input.error_code;
  status->warnings = m_input.warnings;
  status->safe_requested = m_input_safe;
  status->watchdog_expired = !m_input.run
                             && m_input_watchdog != PIXTEND_WATCHDOG_OFF
                             && !m_input_safe;
  return PIXTEND_OK;
}
