/*
 * convert.h -- Raw register counts to physical units and back
 *
 * Analog inputs 0-3 measure voltage against a 5 V or 10 V reference
 * selected by a board jumper; inputs 4-5 measure current.  The two DAC
 * outputs span 0-10 V in 10-bit steps.  DHT11/DHT22 sensor words are
 * decoded into degrees Celsius and relative humidity.
 */

#ifndef PIXTEND_CONVERT_H
#define PIXTEND_CONVERT_H

#include <stddef.h>
#include <stdint.h>

/* Analog input scaling */
#define PIXTEND_ANALOG_IN_COUNTS      1024.0
#define PIXTEND_CURRENT_MA_PER_COUNT  0.020158400229358

/* DAC output span */
#define PIXTEND_ANALOG_OUT_MAX_V      10.0

/* Raw DHT payload: humidity pair, temperature pair, checksum */
#define PIXTEND_DHT_PAYLOAD_LEN       5

/* How an analog input channel is wired */
enum pixtend_analog_mode
{
  PIXTEND_ANALOG_5V = 0,     /* voltage, 0-5 V jumper */
  PIXTEND_ANALOG_10V,        /* voltage, 0-10 V jumper (board default) */
  PIXTEND_ANALOG_CURRENT     /* current, 0-20 mA */
};

enum pixtend_sensor_kind
{
  PIXTEND_DHT11 = 0,
  PIXTEND_DHT22              /* also AM2302 */
};

struct pixtend_sensor_reading
{
  double celsius;
  double humidity;           /* relative humidity, 0.0 to 1.0 */
};

/*
 * pixtend_analog_mode_check -- Check that MODE fits the hardware of an
 * analog input channel.
 *
 * Returns:
 *   PIXTEND_OK, PIXTEND_ERR_INVALID_CHANNEL for channels past 5, or
 *   PIXTEND_ERR_INVALID_MODE (voltage mode on 4-5, current mode on 0-3,
 *   unknown mode).
 */
int pixtend_analog_mode_check (unsigned channel, int mode);

/*
 * pixtend_analog_default_mode -- Mode of CHANNEL on a freshly jumpered
 * board: 10 V for voltage inputs, current for 4-5.
 */
int pixtend_analog_default_mode (unsigned channel);

/*
 * pixtend_analog_in_value -- Convert a raw analog input count.
 *
 * Returns volts for the voltage modes and milliamps for current mode.
 *
 * Example:
 *   pixtend_analog_in_value (512, PIXTEND_ANALOG_10V);      // => 5.0
 *   pixtend_analog_in_value (992, PIXTEND_ANALOG_CURRENT);  // => ~20.0
 */
double pixtend_analog_in_value (uint16_t raw, int mode);

/*
 * pixtend_volts_to_dac -- Convert an output voltage to a DAC count.
 *
 * The count is truncated, matching the board's reference library.
 *
 * Returns:
 *   PIXTEND_OK, or PIXTEND_ERR_OUT_OF_RANGE for NaN or values outside
 *   0..PIXTEND_ANALOG_OUT_MAX_V.  Values are never clamped.
 *
 * Example:
 *   uint16_t raw;
 *   pixtend_volts_to_dac (10.0, &raw);  // raw = 1023
 *   pixtend_volts_to_dac (5.0, &raw);   // raw = 511
 */
int pixtend_volts_to_dac (double volts, uint16_t *raw);

/* pixtend_dac_to_volts -- Voltage produced by a DAC count. */
double pixtend_dac_to_volts (uint16_t raw);

/*
 * pixtend_sensor_decode -- Decode the temperature and humidity words
 * the board forwards for a sensor slot.
 *
 * Args:
 *   temp: Temperature word (first sensor byte in the high byte).
 *   hum:  Humidity word.
 *   kind: PIXTEND_DHT11 or PIXTEND_DHT22.
 *   out:  Reading, only written on success.
 *
 * Returns:
 *   PIXTEND_OK, PIXTEND_ERR_NO_SENSOR when both words are 0x0000 or both
 *   are 0xFFFF, or PIXTEND_ERR_OUT_OF_RANGE for an unknown kind.
 *
 * Example:
 *   struct pixtend_sensor_reading r;
 *   pixtend_sensor_decode (0x80F5, 0x0292, PIXTEND_DHT22, &r);
 *   // r.celsius = -24.5, r.humidity = 0.658
 */
int pixtend_sensor_decode (uint16_t temp, uint16_t hum, int kind,
                           struct pixtend_sensor_reading *out);

/*
 * pixtend_sensor_decode_raw -- Decode a sensor's own 5-byte payload.
 *
 * Payload layout: humidity high, humidity low, temperature high,
 * temperature low, checksum (low 8 bits of the sum of the first four).
 *
 * Returns:
 *   PIXTEND_OK, PIXTEND_ERR_LENGTH if len != PIXTEND_DHT_PAYLOAD_LEN,
 *   PIXTEND_ERR_NO_SENSOR for an all-zero or all-0xFF payload,
 *   PIXTEND_ERR_SENSOR_PARITY if the checksum byte does not match, or
 *   PIXTEND_ERR_OUT_OF_RANGE for an unknown kind.
 */
int pixtend_sensor_decode_raw (const uint8_t *payload, size_t len, int kind,
                               struct pixtend_sensor_reading *out);

#endif /* PIXTEND_CONVERT_H */
