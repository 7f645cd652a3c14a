/*
 * protocol.h -- PiXtend V2 -L- frame encoding/decoding
 *
 * Typed views of the output and input frames and the codec between them
 * and the raw 111-byte SPI frames described in registers.h.  Encoders
 * never fail; decoders verify length and both CRCs before a single field
 * is extracted.
 */

#ifndef PIXTEND_PROTOCOL_H
#define PIXTEND_PROTOCOL_H

#include <stddef.h>
#include <stdint.h>

#include "registers.h"

/* Watchdog period codes (output frame byte 2) */
enum pixtend_watchdog
{
  PIXTEND_WATCHDOG_OFF = 0,
  PIXTEND_WATCHDOG_16MS,
  PIXTEND_WATCHDOG_32MS,
  PIXTEND_WATCHDOG_64MS,
  PIXTEND_WATCHDOG_125MS,
  PIXTEND_WATCHDOG_250MS,
  PIXTEND_WATCHDOG_500MS,
  PIXTEND_WATCHDOG_1S,
  PIXTEND_WATCHDOG_2S,
  PIXTEND_WATCHDOG_4S,
  PIXTEND_WATCHDOG_8S
};

#define PIXTEND_WATCHDOG_MAX  PIXTEND_WATCHDOG_8S

enum pixtend_gpio_mode
{
  PIXTEND_GPIO_INPUT = 0,
  PIXTEND_GPIO_INPUT_PULLUP,
  PIXTEND_GPIO_OUTPUT,
  PIXTEND_GPIO_SENSOR    /* DHT11 / DHT22 / AM2302 one-wire sensor */
};

enum pixtend_pwm_mode
{
  PIXTEND_PWM_SERVO = 0,
  PIXTEND_PWM_DUTY_CYCLE,
  PIXTEND_PWM_UNIVERSAL,
  PIXTEND_PWM_FREQUENCY
};

#define PIXTEND_PWM_MODE_MAX  PIXTEND_PWM_FREQUENCY

enum pixtend_pwm_prescaler
{
  PIXTEND_PWM_PRESCALE_OFF = 0,
  PIXTEND_PWM_PRESCALE_16MHZ,
  PIXTEND_PWM_PRESCALE_2MHZ,
  PIXTEND_PWM_PRESCALE_250KHZ,
  PIXTEND_PWM_PRESCALE_62K5HZ,
  PIXTEND_PWM_PRESCALE_15K625HZ
};

#define PIXTEND_PWM_PRESCALE_MAX  PIXTEND_PWM_PRESCALE_15K625HZ

struct pixtend_pwm_group
{
  uint8_t mode;          /* enum pixtend_pwm_mode */
  uint8_t prescaler;     /* enum pixtend_pwm_prescaler */
  bool enable[PIXTEND_PWM_CHANNELS];
  uint16_t ctrl1;        /* frequency divider in duty-cycle/universal mode */
  uint16_t value[PIXTEND_PWM_CHANNELS];
};

/* One DAC channel; not part of the 111-byte frame */
struct pixtend_dac_channel
{
  bool enabled;
  uint16_t value;        /* 0..PIXTEND_DAC_MAX */
};

/*
 * Desired board state: everything the host sends in one cycle.
 * Bit n of the bitmask fields is channel n.
 */
struct pixtend_output
{
  uint8_t watchdog;                            /* enum pixtend_watchdog */
  uint8_t system;                              /* PIXTEND_SYS_* */
  uint8_t di_debounce[PIXTEND_NUM_DI_DEBOUNCE];
  uint16_t digital_out;
  uint8_t relay_out;
  uint8_t gpio_mode[PIXTEND_NUM_GPIO];         /* enum pixtend_gpio_mode */
  uint8_t gpio_level;                          /* levels of output GPIOs */
  uint8_t gpio_debounce[PIXTEND_NUM_GPIO_DEBOUNCE];
  struct pixtend_pwm_group pwm[PIXTEND_NUM_PWM_GROUPS];
  uint8_t retain[PIXTEND_RETAIN_LEN];
  struct pixtend_dac_channel dac[PIXTEND_NUM_ANALOG_OUT];
};

/* Raw temperature and humidity words of one sensor slot */
struct pixtend_sensor_slot
{
  uint16_t temperature;
  uint16_t humidity;
};

/* Board state as reported in one input frame */
struct pixtend_input
{
  uint8_t firmware;
  uint8_t hardware;
  uint8_t model;
  uint8_t error_code;                          /* PIXTEND_BOARD_* */
  bool run;
  uint8_t warnings;                            /* PIXTEND_WARN_* */
  uint16_t digital_in;
  uint16_t analog_in[PIXTEND_NUM_ANALOG_IN];   /* raw 10-bit counts */
  uint8_t gpio_in;
  struct pixtend_sensor_slot sensor[PIXTEND_NUM_SENSORS];
  uint8_t retain[PIXTEND_RETAIN_LEN];
};

/*
 * pixtend_output_init -- Power-on defaults: everything off, watchdog
 * disabled, all GPIOs plain inputs, DAC channels disabled.
 */
void pixtend_output_init (struct pixtend_output *out);

/*
 * pixtend_input_init -- An idle -L- board: model 'L', running, no
 * errors, all inputs low.
 */
void pixtend_input_init (struct pixtend_input *in);

/*
 * pixtend_encode_output -- Serialize the output state into a frame.
 *
 * Writes all PIXTEND_FRAME_LEN bytes of FRAME, including the model byte,
 * zeroed reserved bytes and both CRCs.  The DAC channels are not part
 * of the frame; see pixtend_encode_dac.
 *
 * Args:
 *   out:   Output state.  Values are assumed validated by the caller.
 *   frame: Output buffer of PIXTEND_FRAME_LEN bytes.
 */
void pixtend_encode_output (const struct pixtend_output *out, uint8_t *frame);

/*
 * pixtend_decode_output -- Parse a raw output frame.
 *
 * Used by board simulators and tests.  The DAC channels of OUT are left
 * unchanged.
 *
 * Returns:
 *   PIXTEND_OK, PIXTEND_ERR_LENGTH if len != PIXTEND_FRAME_LEN, or
 *   PIXTEND_ERR_CHECKSUM if either CRC does not match.  OUT is only
 *   written on success.
 */
int pixtend_decode_output (const uint8_t *data, size_t len,
                           struct pixtend_output *out);

/*
 * pixtend_encode_input -- Serialize a board state into an input frame.
 *
 * The counterpart of pixtend_decode_input, used to simulate the board.
 */
void pixtend_encode_input (const struct pixtend_input *in, uint8_t *frame);

/*
 * pixtend_decode_input -- Parse a raw input frame received from the board.
 *
 * Verifies length and both CRCs before extracting any field.  The model
 * byte and board error code are returned as-is; judging them is up to
 * the caller.
 *
 * Args:
 *   data: Raw frame bytes.
 *   len:  Number of bytes in data.
 *   in:   Output struct, only written on success.
 *
 * Returns:
 *   PIXTEND_OK, PIXTEND_ERR_LENGTH or PIXTEND_ERR_CHECKSUM.
 *
 * Example:
 *   uint8_t rx[PIXTEND_FRAME_LEN];
 *   struct pixtend_input in;
 *   if (pixtend_decode_input (rx, sizeof (rx), &in) == PIXTEND_OK)
 *     printf ("firmware %u\n", in.firmware);
 */
int pixtend_decode_input (const uint8_t *data, size_t len,
                          struct pixtend_input *in);

/*
 * pixtend_encode_dac -- Build the 2-byte command word for one DAC channel.
 *
 * Args:
 *   channel: 0 (A) or 1 (B).
 *   dac:     Channel state; value is masked to 10 bits.
 *   word:    Output buffer of PIXTEND_DAC_WORD_LEN bytes, big-endian.
 *
 * Example:
 *   struct pixtend_dac_channel dac = {true, 545};
 *   uint8_t word[2];
 *   pixtend_encode_dac (1, &dac, word);  // word = {0x98, 0x84}
 */
void pixtend_encode_dac (unsigned channel, const struct pixtend_dac_channel *dac,
                         uint8_t *word);

/*
 * pixtend_decode_dac -- Parse a DAC command word.
 *
 * Returns:
 *   PIXTEND_OK, or PIXTEND_ERR_LENGTH if len != PIXTEND_DAC_WORD_LEN.
 */
int pixtend_decode_dac (const uint8_t *word, size_t len, unsigned *channel,
                        struct pixtend_dac_channel *dac);

#endif /* PIXTEND_PROTOCOL_H */
