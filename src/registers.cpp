/*
 * registers.cpp -- PiXtend V2 -L- field descriptors and accessors
 */

#include "registers.h"

/* The header and data blocks must tile the frame exactly */
static_assert (PIXTEND_HEADER_LEN + 2 + PIXTEND_DATA_LEN + 2
               == PIXTEND_FRAME_LEN, "frame geometry");
static_assert (PIXTEND_HEADER_CRC_OFS == PIXTEND_HEADER_OFS
               + PIXTEND_HEADER_LEN, "header CRC follows header");
static_assert (PIXTEND_DATA_CRC_OFS == PIXTEND_DATA_OFS + PIXTEND_DATA_LEN,
               "data CRC follows data");
static_assert (PIXTEND_OUT_PWM + PIXTEND_NUM_PWM_GROUPS
               * PIXTEND_PWM_GROUP_LEN == PIXTEND_OUT_RETAIN,
               "PWM block ends at retain");
static_assert (PIXTEND_IN_SENSOR + PIXTEND_NUM_SENSORS
               * PIXTEND_SENSOR_SLOT_LEN + 5 == PIXTEND_IN_RETAIN,
               "sensor block plus reserved ends at retain");
static_assert (PIXTEND_OUT_RETAIN + PIXTEND_RETAIN_LEN
               == PIXTEND_DATA_CRC_OFS, "retain ends the output data");
static_assert (PIXTEND_IN_RETAIN + PIXTEND_RETAIN_LEN
               == PIXTEND_DATA_CRC_OFS, "retain ends the input data");

const struct pixtend_field PIXTEND_F_OUT_MODEL = {PIXTEND_OUT_MODEL, 0, 8};
const struct pixtend_field PIXTEND_F_OUT_WATCHDOG = {PIXTEND_OUT_WATCHDOG, 0, 8};
const struct pixtend_field PIXTEND_F_OUT_SYSTEM = {PIXTEND_OUT_SYSTEM, 0, 8};
const struct pixtend_field PIXTEND_F_OUT_DIGITAL = {PIXTEND_OUT_DIGITAL, 0, 16};
const struct pixtend_field PIXTEND_F_OUT_RELAY = {PIXTEND_OUT_RELAY, 0, 4};
const struct pixtend_field PIXTEND_F_OUT_GPIO_DIR = {PIXTEND_OUT_GPIO_CTRL, 0, 4};
const struct pixtend_field PIXTEND_F_OUT_GPIO_SENSOR
  = {PIXTEND_OUT_GPIO_CTRL, PIXTEND_GPIO_CTRL_SENSOR_SHIFT, 4};
const struct pixtend_field PIXTEND_F_OUT_GPIO_OUT = {PIXTEND_OUT_GPIO_OUT, 0, 4};

const struct pixtend_field PIXTEND_F_IN_FIRMWARE = {PIXTEND_IN_FIRMWARE, 0, 8};
const struct pixtend_field PIXTEND_F_IN_HARDWARE = {PIXTEND_IN_HARDWARE, 0, 8};
const struct pixtend_field PIXTEND_F_IN_MODEL = {PIXTEND_IN_MODEL, 0, 8};
const struct pixtend_field PIXTEND_F_IN_ERROR_CODE = {PIXTEND_IN_STATE, 4, 4};
const struct pixtend_field PIXTEND_F_IN_RUN = {PIXTEND_IN_STATE, 0, 1};
const struct pixtend_field PIXTEND_F_IN_WARNINGS = {PIXTEND_IN_WARNINGS, 0, 8};
const struct pixtend_field PIXTEND_F_IN_DIGITAL = {PIXTEND_IN_DIGITAL, 0, 16};
const struct pixtend_field PIXTEND_F_IN_GPIO = {PIXTEND_IN_GPIO, 0, 4};

static struct pixtend_field
make_field (unsigned offset, unsigned shift, unsigned width)
{
  struct pixtend_field f;
  f.offset = (uint8_t) offset;
  f.shift = (uint8_t) shift;
  f.width = (uint8_t) width;
  return f;
}

static unsigned
pwm_base (unsigned group)
{
  return PIXTEND_OUT_PWM + group * PIXTEND_PWM_GROUP_LEN;
}

struct pixtend_field
pixtend_f_di_debounce (unsigned group)
{
  return make_field (PIXTEND_OUT_DI_DEBOUNCE + group, 0, 8);
}

struct pixtend_field
pixtend_f_gpio_debounce (unsigned group)
{
  return make_field (PIXTEND_OUT_GPIO_DEBOUNCE + group, 0, 8);
}

/* ctrl0: b7..b5 prescaler, b4 channel B, b3 channel A, b1..b0 mode */
struct pixtend_field
pixtend_f_pwm_prescaler (unsigned group)
{
  return make_field (pwm_base (group) + PIXTEND_PWM_CTRL0, 5, 3);
}

struct pixtend_field
pixtend_f_pwm_enable (unsigned group, unsigned channel)
{
  return make_field (pwm_base (group) + PIXTEND_PWM_CTRL0, 3 + channel, 1);
}

struct pixtend_field
pixtend_f_pwm_mode (unsigned group)
{
  return make_field (pwm_base (group) + PIXTEND_PWM_CTRL0, 0, 2);
}

struct pixtend_field
pixtend_f_pwm_ctrl1 (unsigned group)
{
  return make_field (pwm_base (group) + PIXTEND_PWM_CTRL1, 0, 16);
}

struct pixtend_field
pixtend_f_pwm_value (unsigned group, unsigned channel)
{
  return make_field (pwm_base (group) + PIXTEND_PWM_VALUE + channel * 2, 0, 16);
}

struct pixtend_field
pixtend_f_analog_in (unsigned channel)
{
  return make_field (PIXTEND_IN_ANALOG + channel * 2, 0, 16);
}

struct pixtend_field
pixtend_f_sensor_temp (unsigned slot)
{
  return make_field (PIXTEND_IN_SENSOR + slot * PIXTEND_SENSOR_SLOT_LEN, 0, 16);
}

struct pixtend_field
pixtend_f_sensor_hum (unsigned slot)
{
  return make_field (PIXTEND_IN_SENSOR + slot * PIXTEND_SENSOR_SLOT_LEN + 2,
                     0, 16);
}

uint16_t
pixtend_reg_get (const uint8_t *frame, struct pixtend_field f)
{
  if (f.width == 16)
    return (uint16_t) (frame[f.offset] | (frame[f.offset + 1] << 8));

  uint8_t mask = (uint8_t) ((1u << f.width) - 1);
  return (uint16_t) ((frame[f.offset] >> f.shift) & mask);
}

void
pixtend_reg_put (uint8_t *frame, struct pixtend_field f, uint16_t value)
{
  if (f.width == 16)
    {
      frame[f.offset]     = (uint8_t) (value & 0xFF);
      frame[f.offset + 1] = (uint8_t) (value >> 8);
      return;
    }

  uint8_t mask = (uint8_t) (((1u << f.width) - 1) << f.shift);
  frame[f.offset] = (uint8_t) ((frame[f.offset] & ~mask)
                               | ((value << f.shift) & mask));
}
