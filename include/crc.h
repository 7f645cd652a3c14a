/*
 * crc.h -- CRC-16/MODBUS checksums for PiXtend frames
 *
 * Both the header and the data block of every frame carry a trailing
 * little-endian CRC-16/MODBUS.  A frame is only trusted when both match.
 */

#ifndef PIXTEND_CRC_H
#define PIXTEND_CRC_H

#include <stddef.h>
#include <stdint.h>

/*
 * pixtend_crc16 -- CRC of one frame block as the board firmware computes it.
 *
 * Bitwise CRC-16/MODBUS: start at 0xFFFF, shift right, XOR in 0xA001
 * whenever a one drops out.  Nothing is XORed at the end.
 *
 * Args:
 *   data: First byte of the block.
 *   len:  Block length (PIXTEND_HEADER_LEN or PIXTEND_DATA_LEN for frames).
 *
 * Returns:
 *   The CRC, to be stored low byte first after the block.
 *
 * Example:
 *   pixtend_crc16 ((const uint8_t *) "123456789", 9);  // => 0x4B37
 */
uint16_t pixtend_crc16 (const uint8_t *data, size_t len);

/*
 * pixtend_crc_store -- Append the CRC of a block.
 *
 * Computes the CRC over data[0..len) and writes it little-endian to
 * data[len] and data[len + 1].  The buffer must hold len + 2 bytes.
 */
void pixtend_crc_store (uint8_t *data, size_t len);

/*
 * pixtend_crc_verify -- Check the trailing CRC of a block.
 *
 * Returns:
 *   true if data[len..len+1] holds the CRC of data[0..len).
 */
bool pixtend_crc_verify (const uint8_t *data, size_t len);

/*
 * pixtend_crc_seal_frame -- Fill in both CRCs of a 111-byte frame.
 */
void pixtend_crc_seal_frame (uint8_t *frame);

/*
 * pixtend_crc_verify_frame -- Check both CRCs of a 111-byte frame.
 *
 * Returns:
 *   true only if the header CRC and the data CRC both match.
 */
bool pixtend_crc_verify_frame (const uint8_t *frame);

#endif /* PIXTEND_CRC_H */
