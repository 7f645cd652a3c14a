/*
 * crc.cpp -- CRC-16/MODBUS checksums for PiXtend frames
 */

#include "crc.h"
#include "registers.h"

#define CRC_POLY_REFLECTED  0xA001

uint16_t
pixtend_crc16 (const uint8_t *data, size_t len)
{
  uint16_t crc = 0xFFFF;
  const uint8_t *end = data + len;

  while (data < end)
    {
      crc ^= *data++;
      for (int n = 8; n > 0; n--)
        crc = (crc & 1) ? (uint16_t) ((crc >> 1) ^ CRC_POLY_REFLECTED)
                        : (uint16_t) (crc >> 1);
    }
  return crc;
}

void
pixtend_crc_store (uint8_t *data, size_t len)
{
  uint16_t crc = pixtend_crc16 (data, len);
  data[len]     = (uint8_t) (crc & 0xFF);
  data[len + 1] = (uint8_t) (crc >> 8);
}

bool
pixtend_crc_verify (const uint8_t *data, size_t len)
{
  uint16_t crc_received = (uint16_t) data[len]
                        | ((uint16_t) data[len + 1] << 8);
  return crc_received == pixtend_crc16 (data, len);
}

void
pixtend_crc_seal_frame (uint8_t *frame)
{
  pixtend_crc_store (&frame[PIXTEND_HEADER_OFS], PIXTEND_HEADER_LEN);
  pixtend_crc_store (&frame[PIXTEND_DATA_OFS], PIXTEND_DATA_LEN);
}

bool
pixtend_crc_verify_frame (const uint8_t *frame)
{
  return pixtend_crc_verify (&frame[PIXTEND_HEADER_OFS], PIXTEND_HEADER_LEN)
         && pixtend_crc_verify (&frame[PIXTEND_DATA_OFS], PIXTEND_DATA_LEN);
}
