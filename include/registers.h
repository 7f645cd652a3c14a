/*
 * registers.h -- PiXtend V2 -L- SPI frame layout
 *
 * Byte offsets, bit positions and widths of every field in the 111-byte
 * output and input frames, plus the 2-byte DAC word.  Fields are
 * described by pixtend_field descriptors; pixtend_reg_get/put read and
 * write them with the right masking.  Multi-byte fields are little-endian.
 *
 * Frame layout (both directions):
 *   [0..6]     header
 *   [7..8]     header CRC over [0..6]
 *   [9..108]   data block
 *   [109..110] data CRC over [9..108]
 */

#ifndef PIXTEND_REGISTERS_H
#define PIXTEND_REGISTERS_H

#include <stddef.h>
#include <stdint.h>

/* Frame geometry */
#define PIXTEND_FRAME_LEN        111
#define PIXTEND_HEADER_OFS       0
#define PIXTEND_HEADER_LEN       7
#define PIXTEND_HEADER_CRC_OFS   7
#define PIXTEND_DATA_OFS         9
#define PIXTEND_DATA_LEN         100
#define PIXTEND_DATA_CRC_OFS     109

/* Model byte of the -L- board */
#define PIXTEND_MODEL_L          0x4C

/* Channel counts */
#define PIXTEND_NUM_DIGITAL_OUT  12
#define PIXTEND_NUM_DIGITAL_IN   16
#define PIXTEND_NUM_RELAYS       4
#define PIXTEND_NUM_GPIO         4
#define PIXTEND_NUM_ANALOG_IN    6
#define PIXTEND_NUM_VOLTAGE_IN   4
#define PIXTEND_NUM_ANALOG_OUT   2
#define PIXTEND_NUM_PWM_GROUPS   3
#define PIXTEND_PWM_CHANNELS     2
#define PIXTEND_NUM_DI_DEBOUNCE  8
#define PIXTEND_NUM_GPIO_DEBOUNCE 2
#define PIXTEND_NUM_SENSORS      4
#define PIXTEND_RETAIN_LEN       64

/* -- Output frame ---------------------------------------------------------- */

#define PIXTEND_OUT_MODEL           0
#define PIXTEND_OUT_UC_MODE         1
#define PIXTEND_OUT_WATCHDOG        2
#define PIXTEND_OUT_SYSTEM          3
#define PIXTEND_OUT_DI_DEBOUNCE     9
#define PIXTEND_OUT_DIGITAL         17
#define PIXTEND_OUT_RELAY           19
#define PIXTEND_OUT_GPIO_CTRL       20
#define PIXTEND_OUT_GPIO_OUT        21
#define PIXTEND_OUT_GPIO_DEBOUNCE   22
#define PIXTEND_OUT_PWM             24
#define PIXTEND_OUT_RETAIN          45

/* System control byte (PIXTEND_OUT_SYSTEM) bits */
#define PIXTEND_SYS_SAFE            0x01
#define PIXTEND_SYS_RETAIN_COPY     0x02
#define PIXTEND_SYS_RETAIN_ENABLE   0x04
#define PIXTEND_SYS_LED_DISABLE     0x08
#define PIXTEND_SYS_GPIO_PULLUP     0x10

/* PWM group: ctrl0 (1), ctrl1 (2), channel A (2), channel B (2) */
#define PIXTEND_PWM_GROUP_LEN       7
#define PIXTEND_PWM_CTRL0           0
#define PIXTEND_PWM_CTRL1           1
#define PIXTEND_PWM_VALUE           3

/* GPIO control byte: low nibble direction, high nibble sensor mode */
#define PIXTEND_GPIO_CTRL_SENSOR_SHIFT 4

/* -- Input frame ----------------------------------------------------------- */

#define PIXTEND_IN_FIRMWARE         0
#define PIXTEND_IN_HARDWARE         1
#define PIXTEND_IN_MODEL            2
#define PIXTEND_IN_STATE            3
#define PIXTEND_IN_WARNINGS         4
#define PIXTEND_IN_DIGITAL          9
#define PIXTEND_IN_ANALOG           11
#define PIXTEND_IN_GPIO             23
#define PIXTEND_IN_SENSOR           24
#define PIXTEND_IN_RETAIN           45

/* Sensor slot: temperature u16 then humidity u16 */
#define PIXTEND_SENSOR_SLOT_LEN     4

/* Warnings byte bits */
#define PIXTEND_WARN_RETAIN_CRC     0x02
#define PIXTEND_WARN_VOLTAGE        0x04
#define PIXTEND_WARN_I2C            0x08

/* Board error codes (high nibble of the state byte) */
#define PIXTEND_BOARD_OK            0
#define PIXTEND_BOARD_DATA_CRC      2
#define PIXTEND_BOARD_DATA_SHORT    3
#define PIXTEND_BOARD_MODEL         4
#define PIXTEND_BOARD_HEADER_CRC    5
#define PIXTEND_BOARD_SPI_SPEED     6

/* -- DAC word -------------------------------------------------------------- */

/* 16-bit big-endian word: b15 channel, b12 enabled, b11..b2 value */
#define PIXTEND_DAC_WORD_LEN        2
#define PIXTEND_DAC_CHANNEL_BIT     15
#define PIXTEND_DAC_ENABLE_BIT      12
#define PIXTEND_DAC_VALUE_SHIFT     2
#define PIXTEND_DAC_MAX             1023

/*
 * A field inside a frame.  Fields up to 8 bits live in one byte at
 * OFFSET, starting at bit SHIFT.  16-bit fields always start at bit 0
 * and span OFFSET (low byte) and OFFSET + 1 (high byte).
 */
struct pixtend_field
{
  uint8_t offset;
  uint8_t shift;
  uint8_t width;
};

/* Scalar fields */
extern const struct pixtend_field PIXTEND_F_OUT_MODEL;
extern const struct pixtend_field PIXTEND_F_OUT_WATCHDOG;
extern const struct pixtend_field PIXTEND_F_OUT_SYSTEM;
extern const struct pixtend_field PIXTEND_F_OUT_DIGITAL;
extern const struct pixtend_field PIXTEND_F_OUT_RELAY;
extern const struct pixtend_field PIXTEND_F_OUT_GPIO_DIR;
extern const struct pixtend_field PIXTEND_F_OUT_GPIO_SENSOR;
extern const struct pixtend_field PIXTEND_F_OUT_GPIO_OUT;
extern const struct pixtend_field PIXTEND_F_IN_FIRMWARE;
extern const struct pixtend_field PIXTEND_F_IN_HARDWARE;
extern const struct pixtend_field PIXTEND_F_IN_MODEL;
extern const struct pixtend_field PIXTEND_F_IN_ERROR_CODE;
extern const struct pixtend_field PIXTEND_F_IN_RUN;
extern const struct pixtend_field PIXTEND_F_IN_WARNINGS;
extern const struct pixtend_field PIXTEND_F_IN_DIGITAL;
extern const struct pixtend_field PIXTEND_F_IN_GPIO;

/* Indexed fields; the index must be in range for the field kind */
struct pixtend_field pixtend_f_di_debounce (unsigned group);
struct pixtend_field pixtend_f_gpio_debounce (unsigned group);
struct pixtend_field pixtend_f_pwm_prescaler (unsigned group);
struct pixtend_field pixtend_f_pwm_enable (unsigned group, unsigned channel);
struct pixtend_field pixtend_f_pwm_mode (unsigned group);
struct pixtend_field pixtend_f_pwm_ctrl1 (unsigned group);
struct pixtend_field pixtend_f_pwm_value (unsigned group, unsigned channel);
struct pixtend_field pixtend_f_analog_in (unsigned channel);
struct pixtend_field pixtend_f_sensor_temp (unsigned slot);
struct pixtend_field pixtend_f_sensor_hum (unsigned slot);

/*
 * pixtend_reg_get -- Read a field from a frame.
 *
 * Args:
 *   frame: PIXTEND_FRAME_LEN-byte frame buffer.
 *   f:     Field descriptor.
 *
 * Returns:
 *   Field value, right-aligned.
 *
 * Example:
 *   uint8_t frame[PIXTEND_FRAME_LEN] = {0};
 *   frame[3] = 0x61;
 *   pixtend_reg_get (frame, PIXTEND_F_IN_ERROR_CODE);  // => 6
 *   pixtend_reg_get (frame, PIXTEND_F_IN_RUN);         // => 1
 */
uint16_t pixtend_reg_get (const uint8_t *frame, struct pixtend_field f);

/*
 * pixtend_reg_put -- Write a field into a frame.
 *
 * Bits outside the field are preserved; bits of VALUE beyond the field
 * width are dropped.
 */
void pixtend_reg_put (uint8_t *frame, struct pixtend_field f, uint16_t value);

#endif /* PIXTEND_REGISTERS_H */
