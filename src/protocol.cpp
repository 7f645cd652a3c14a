/*
 * protocol.cpp -- PiXtend V2 -L- frame encoding/decoding
 *
 * Implements the frame layout described in registers.h.
 */

#include "protocol.h"

#include <string.h>

#include "crc.h"
#include "errors.h"

void
pixtend_output_init (struct pixtend_output *out)
{
  memset (out, 0, sizeof (*out));
  out->watchdog = PIXTEND_WATCHDOG_OFF;
  for (int i = 0; i < PIXTEND_NUM_GPIO; i++)
    out->gpio_mode[i] = PIXTEND_GPIO_INPUT;
}

void
pixtend_input_init (struct pixtend_input *in)
{
  memset (in, 0, sizeof (*in));
  in->model = PIXTEND_MODEL_L;
  in->error_code = PIXTEND_BOARD_OK;
  in->run = true;
}

/*
 * Split the per-GPIO modes into the direction, sensor and output
 * nibbles.  The output nibble doubles as pull-up enable for inputs.
 */
static void
encode_gpio (const struct pixtend_output *out, uint8_t *dir, uint8_t *sensor,
             uint8_t *level)
{
  *dir = 0;
  *sensor = 0;
  *level = 0;
  for (int i = 0; i < PIXTEND_NUM_GPIO; i++)
    {
      uint8_t bit = (uint8_t) (1u << i);
      switch (out->gpio_mode[i])
        {
        case PIXTEND_GPIO_OUTPUT:
          *dir |= bit;
          *level |= out->gpio_level & bit;
          break;
        case PIXTEND_GPIO_SENSOR:
          *sensor |= bit;
          break;
        case PIXTEND_GPIO_INPUT_PULLUP:
          *level |= bit;
          break;
        default:
          break;
        }
    }
}

void
pixtend_encode_output (const struct pixtend_output *out, uint8_t *frame)
{
  uint8_t dir, sensor, level;
  int g, c;

  memset (frame, 0, PIXTEND_FRAME_LEN);

  /* Header */
  pixtend_reg_put (frame, PIXTEND_F_OUT_MODEL, PIXTEND_MODEL_L);
  pixtend_reg_put (frame, PIXTEND_F_OUT_WATCHDOG, out->watchdog);
  pixtend_reg_put (frame, PIXTEND_F_OUT_SYSTEM, out->system);

  /* Data */
  for (g = 0; g < PIXTEND_NUM_DI_DEBOUNCE; g++)
    pixtend_reg_put (frame, pixtend_f_di_debounce (g), out->di_debounce[g]);

  pixtend_reg_put (frame, PIXTEND_F_OUT_DIGITAL,
                   out->digital_out & ((1u << PIXTEND_NUM_DIGITAL_OUT) - 1));
  pixtend_reg_put (frame, PIXTEND_F_OUT_RELAY, out->relay_out);

  encode_gpio (out, &dir, &sensor, &level);
  pixtend_reg_put (frame, PIXTEND_F_OUT_GPIO_DIR, dir);
  pixtend_reg_put (frame, PIXTEND_F_OUT_GPIO_SENSOR, sensor);
  pixtend_reg_put (frame, PIXTEND_F_OUT_GPIO_OUT, level);

  for (g = 0; g < PIXTEND_NUM_GPIO_DEBOUNCE; g++)
    pixtend_reg_put (frame, pixtend_f_gpio_debounce (g),
                     out->gpio_debounce[g]);

  for (g = 0; g < PIXTEND_NUM_PWM_GROUPS; g++)
    {
      const struct pixtend_pwm_group *pwm = &out->pwm[g];
      pixtend_reg_put (frame, pixtend_f_pwm_prescaler (g), pwm->prescaler);
      pixtend_reg_put (frame, pixtend_f_pwm_mode (g), pwm->mode);
      pixtend_reg_put (frame, pixtend_f_pwm_ctrl1 (g), pwm->ctrl1);
      for (c = 0; c < PIXTEND_PWM_CHANNELS; c++)
        {
          pixtend_reg_put (frame, pixtend_f_pwm_enable (g, c), pwm->enable[c]);
          pixtend_reg_put (frame, pixtend_f_pwm_value (g, c), pwm->value[c]);
        }
    }

  memcpy (&frame[PIXTEND_OUT_RETAIN], out->retain, PIXTEND_RETAIN_LEN);

  pixtend_crc_seal_frame (frame);
}

/*
 * Validate length and CRCs of a received frame.
 * Returns PIXTEND_OK or the integrity error.
 */
static int
check_frame (const uint8_t *data, size_t len)
{
  if (len != PIXTEND_FRAME_LEN)
    return PIXTEND_ERR_LENGTH;
  if (!pixtend_crc_verify_frame (data))
    return PIXTEND_ERR_CHECKSUM;
  return PIXTEND_OK;
}

int
pixtend_decode_output (const uint8_t *data, size_t len,
                       struct pixtend_output *out)
{
  int rc = check_frame (data, len);
  if (rc != PIXTEND_OK)
    return rc;

  uint8_t dir = (uint8_t) pixtend_reg_get (data, PIXTEND_F_OUT_GPIO_DIR);
  uint8_t sensor = (uint8_t) pixtend_reg_get (data, PIXTEND_F_OUT_GPIO_SENSOR);
  uint8_t level = (uint8_t) pixtend_reg_get (data, PIXTEND_F_OUT_GPIO_OUT);
  int g, c;

  out->watchdog = (uint8_t) pixtend_reg_get (data, PIXTEND_F_OUT_WATCHDOG);
  out->system = (uint8_t) pixtend_reg_get (data, PIXTEND_F_OUT_SYSTEM);

  for (g = 0; g < PIXTEND_NUM_DI_DEBOUNCE; g++)
    out->di_debounce[g] = (uint8_t) pixtend_reg_get (data,
                                                     pixtend_f_di_debounce (g));

  out->digital_out = pixtend_reg_get (data, PIXTEND_F_OUT_DIGITAL)
                     & ((1u << PIXTEND_NUM_DIGITAL_OUT) - 1);
  out->relay_out = (uint8_t) pixtend_reg_get (data, PIXTEND_F_OUT_RELAY);

  out->gpio_level = 0;
  for (int i = 0; i < PIXTEND_NUM_GPIO; i++)
    {
      uint8_t bit = (uint8_t) (1u << i);
      if (sensor & bit)
        out->gpio_mode[i] = PIXTEND_GPIO_SENSOR;
      else if (dir & bit)
        {
          out->gpio_mode[i] = PIXTEND_GPIO_OUTPUT;
          out->gpio_level |= level & bit;
        }
      else if (level & bit)
        out->gpio_mode[i] = PIXTEND_GPIO_INPUT_PULLUP;
      else
        out->gpio_mode[i] = PIXTEND_GPIO_INPUT;
    }

  for (g = 0; g < PIXTEND_NUM_GPIO_DEBOUNCE; g++)
    out->gpio_debounce[g]
      = (uint8_t) pixtend_reg_get (data, pixtend_f_gpio_debounce (g));

  for (g = 0; g < PIXTEND_NUM_PWM_GROUPS; g++)
    {
      struct pixtend_pwm_group *pwm = &out->pwm[g];
      pwm->prescaler = (uint8_t) pixtend_reg_get (data,
                                                  pixtend_f_pwm_prescaler (g));
      pwm->mode = (uint8_t) pixtend_reg_get (data, pixtend_f_pwm_mode (g));
      pwm->ctrl1 = pixtend_reg_get (data, pixtend_f_pwm_ctrl1 (g));
      for (c = 0; c < PIXTEND_PWM_CHANNELS; c++)
        {
          pwm->enable[c] = pixtend_reg_get (data, pixtend_f_pwm_enable (g, c));
          pwm->value[c] = pixtend_reg_get (data, pixtend_f_pwm_value (g, c));
        }
    }

  memcpy (out->retain, &data[PIXTEND_OUT_RETAIN], PIXTEND_RETAIN_LEN);
  return PIXTEND_OK;
}

void
pixtend_encode_input (const struct pixtend_input *in, uint8_t *frame)
{
  int i;

  memset (frame, 0, PIXTEND_FRAME_LEN);

  pixtend_reg_put (frame, PIXTEND_F_IN_FIRMWARE, in->firmware);
  pixtend_reg_put (frame, PIXTEND_F_IN_HARDWARE, in->hardware);
  pixtend_reg_put (frame, PIXTEND_F_IN_MODEL, in->model);
  pixtend_reg_put (frame, PIXTEND_F_IN_ERROR_CODE, in->error_code);
  pixtend_reg_put (frame, PIXTEND_F_IN_RUN, in->run);
  pixtend_reg_put (frame, PIXTEND_F_IN_WARNINGS, in->warnings);

  pixtend_reg_put (frame, PIXTEND_F_IN_DIGITAL, in->digital_in);
  for (i = 0; i < PIXTEND_NUM_ANALOG_IN; i++)
    pixtend_reg_put (frame, pixtend_f_analog_in (i), in->analog_in[i]);
  pixtend_reg_put (frame, PIXTEND_F_IN_GPIO, in->gpio_in);
  for (i = 0; i < PIXTEND_NUM_SENSORS; i++)
    {
      pixtend_reg_put (frame, pixtend_f_sensor_temp (i),
                       in->sensor[i].temperature);
      pixtend_reg_put (frame, pixtend_f_sensor_hum (i),
                       in->sensor[i].humidity);
    }

  memcpy (&frame[PIXTEND_IN_RETAIN], in->retain, PIXTEND_RETAIN_LEN);

  pixtend_crc_seal_frame (frame);
}

int
pixtend_decode_input (const uint8_t *data, size_t len,
                      struct pixtend_input *in)
{
  int rc = check_frame (data, len);
  if (rc != PIXTEND_OK)
    return rc;

  int i;

  in->firmware = (uint8_t) pixtend_reg_get (data, PIXTEND_F_IN_FIRMWARE);
  in->hardware = (uint8_t) pixtend_reg_get (data, PIXTEND_F_IN_HARDWARE);
  in->model = (uint8_t) pixtend_reg_get (data, PIXTEND_F_IN_MODEL);
  in->error_code = (uint8_t) pixtend_reg_get (data, PIXTEND_F_IN_ERROR_CODE);
  in->run = pixtend_reg_get (data, PIXTEND_F_IN_RUN) != 0;
  in->warnings = (uint8_t) pixtend_reg_get (data, PIXTEND_F_IN_WARNINGS);

  in->digital_in = pixtend_reg_get (data, PIXTEND_F_IN_DIGITAL);
  for (i = 0; i < PIXTEND_NUM_ANALOG_IN; i++)
    in->analog_in[i] = pixtend_reg_get (data, pixtend_f_analog_in (i));
  in->gpio_in = (uint8_t) pixtend_reg_get (data, PIXTEND_F_IN_GPIO);
  for (i = 0; i < PIXTEND_NUM_SENSORS; i++)
    {
      in->sensor[i].temperature = pixtend_reg_get (data,
                                                   pixtend_f_sensor_temp (i));
      in->sensor[i].humidity = pixtend_reg_get (data, pixtend_f_sensor_hum (i));
    }

  memcpy (in->retain, &data[PIXTEND_IN_RETAIN], PIXTEND_RETAIN_LEN);
  return PIXTEND_OK;
}

void
pixtend_encode_dac (unsigned channel, const struct pixtend_dac_channel *dac,
                    uint8_t *word)
{
  uint16_t w = 0;

  if (channel)
    w |= 1u << PIXTEND_DAC_CHANNEL_BIT;
  if (dac->enabled)
    w |= 1u << PIXTEND_DAC_ENABLE_BIT;
  w |= (uint16_t) ((dac->value & PIXTEND_DAC_MAX) << PIXTEND_DAC_VALUE_SHIFT);

  word[0] = (uint8_t) (w >> 8);
  word[1] = (uint8_t) (w & 0xFF);
}

int
pixtend_decode_dac (const uint8_t *word, size_t len, unsigned *channel,
                    struct pixtend_dac_channel *dac)
{
  if (len != PIXTEND_DAC_WORD_LEN)
    return PIXTEND_ERR_LENGTH;

  uint16_t w = (uint16_t) ((word[0] << 8) | word[1]);
  *channel = (w >> PIXTEND_DAC_CHANNEL_BIT) & 1;
  dac->enabled = ((w >> PIXTEND_DAC_ENABLE_BIT) & 1) != 0;
  dac->value = (uint16_t) ((w >> PIXTEND_DAC_VALUE_SHIFT) & PIXTEND_DAC_MAX);
  return PIXTEND_OK;
}
