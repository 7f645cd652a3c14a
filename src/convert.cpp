/*
 * convert.cpp -- Raw register counts to physical units and back
 */

#include "convert.h"

#include "errors.h"
#include "protocol.h"

int
pixtend_analog_mode_check (unsigned channel, int mode)
{
  if (channel >= PIXTEND_NUM_ANALOG_IN)
    return PIXTEND_ERR_INVALID_CHANNEL;

  if (channel < PIXTEND_NUM_VOLTAGE_IN)
    {
      if (mode == PIXTEND_ANALOG_5V || mode == PIXTEND_ANALOG_10V)
        return PIXTEND_OK;
      return PIXTEND_ERR_INVALID_MODE;
    }

  return mode == PIXTEND_ANALOG_CURRENT ? PIXTEND_OK : PIXTEND_ERR_INVALID_MODE;
}

int
pixtend_analog_default_mode (unsigned channel)
{
  return channel < PIXTEND_NUM_VOLTAGE_IN ? PIXTEND_ANALOG_10V
                                          : PIXTEND_ANALOG_CURRENT;
}

double
pixtend_analog_in_value (uint16_t raw, int mode)
{
  switch (mode)
    {
    case PIXTEND_ANALOG_5V:
      return raw * 5.0 / PIXTEND_ANALOG_IN_COUNTS;
    case PIXTEND_ANALOG_10V:
      return raw * 10.0 / PIXTEND_ANALOG_IN_COUNTS;
    default:
      return raw * PIXTEND_CURRENT_MA_PER_COUNT;
    }
}

int
pixtend_volts_to_dac (double volts, uint16_t *raw)
{
  /* Written so that NaN fails too */
  if (!(volts >= 0.0 && volts <= PIXTEND_ANALOG_OUT_MAX_V))
    return PIXTEND_ERR_OUT_OF_RANGE;

  *raw = (uint16_t) (volts / PIXTEND_ANALOG_OUT_MAX_V * PIXTEND_DAC_MAX);
  return PIXTEND_OK;
}

double
pixtend_dac_to_volts (uint16_t raw)
{
  return raw * PIXTEND_ANALOG_OUT_MAX_V / PIXTEND_DAC_MAX;
}

int
pixtend_sensor_decode (uint16_t temp, uint16_t hum, int kind,
                       struct pixtend_sensor_reading *out)
{
  if (kind != PIXTEND_DHT11 && kind != PIXTEND_DHT22)
    return PIXTEND_ERR_OUT_OF_RANGE;

  if ((temp == 0x0000 && hum == 0x0000) || (temp == 0xFFFF && hum == 0xFFFF))
    return PIXTEND_ERR_NO_SENSOR;

  if (kind == PIXTEND_DHT11)
    {
      out->celsius = (temp & 0x7FFF) / 256.0;
      out->humidity = hum / 25600.0;
    }
  else
    {
      /* DHT22 temperature is sign-magnitude */
      out->celsius = (temp & 0x7FFF) / 10.0;
      if (temp & 0x8000)
        out->celsius = -out->celsius;
      out->humidity = hum / 1000.0;
    }
  return PIXTEND_OK;
}

int
pixtend_sensor_decode_raw (const uint8_t *payload, size_t len, int kind,
                           struct pixtend_sensor_reading *out)
{
  if (len != PIXTEND_DHT_PAYLOAD_LEN)
    return PIXTEND_ERR_LENGTH;
  if (kind != PIXTEND_DHT11 && kind != PIXTEND_DHT22)
    return PIXTEND_ERR_OUT_OF_RANGE;

  bool all_zero = true, all_ones = true;
  for (size_t i = 0; i < len; i++)
    {
      if (payload[i] != 0x00)
        all_zero = false;
      if (payload[i] != 0xFF)
        all_ones = false;
    }
  if (all_zero || all_ones)
    return PIXTEND_ERR_NO_SENSOR;

  uint8_t sum = (uint8_t) (payload[0] + payload[1] + payload[2] + payload[3]);
  if (sum != payload[4])
    return PIXTEND_ERR_SENSOR_PARITY;

  uint16_t hum = (uint16_t) ((payload[0] << 8) | payload[1]);
  uint16_t temp = (uint16_t) ((payload[2] << 8) | payload[3]);
  return pixtend_sensor_decode (temp, hum, kind, out);
}
