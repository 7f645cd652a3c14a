/*
 * errors.h -- Status codes returned by the pixtend engine
 *
 * Every fallible function returns an int: PIXTEND_OK (0) on success or
 * one of the negative codes below.  Codes are grouped by origin so a
 * caller can tell a bad argument from a bus problem from a corrupt frame.
 */

#ifndef PIXTEND_ERRORS_H
#define PIXTEND_ERRORS_H

enum pixtend_err
{
  PIXTEND_OK = 0,

  /* Configuration errors: bad argument, nothing was changed */
  PIXTEND_ERR_INVALID_CHANNEL = -1,
  PIXTEND_ERR_OUT_OF_RANGE = -2,
  PIXTEND_ERR_UNSAFE_VALUE = -3,
  PIXTEND_ERR_INVALID_MODE = -4,
  PIXTEND_ERR_PULLUP_DISABLED = -5,
  PIXTEND_ERR_RETAIN_DISABLED = -6,

  /* Transport errors */
  PIXTEND_ERR_TRANSPORT_UNAVAILABLE = -10,
  PIXTEND_ERR_TRANSPORT_TIMEOUT = -11,
  PIXTEND_ERR_BUS = -12,

  /* Integrity errors: received frame failed validation */
  PIXTEND_ERR_CHECKSUM = -20,
  PIXTEND_ERR_LENGTH = -21,
  PIXTEND_ERR_MODEL_MISMATCH = -22,

  /* Errors reported by the board in an otherwise valid frame */
  PIXTEND_ERR_BOARD_CRC = -30,
  PIXTEND_ERR_BOARD_FRAME_SHORT = -31,
  PIXTEND_ERR_BOARD_MODEL = -32,
  PIXTEND_ERR_BOARD_SPI_SPEED = -33,
  PIXTEND_ERR_BOARD_FAULT = -34,
  PIXTEND_ERR_BOARD_NOT_RUNNING = -35,

  /* Session state errors */
  PIXTEND_ERR_NOT_OPEN = -40,
  PIXTEND_ERR_NOT_SYNCHRONIZED = -41,
  PIXTEND_ERR_SESSION_FAULTED = -42,

  /* Sensor read errors */
  PIXTEND_ERR_NO_SENSOR = -50,
  PIXTEND_ERR_SENSOR_PARITY = -51
};

/*
 * pixtend_strerror -- Human-readable message for a status code.
 *
 * Returns a static string; unknown codes map to "unknown error".
 */
const char *pixtend_strerror (int rc);

/*
 * pixtend_is_transport_error -- True for codes raised below the engine
 * (bus could not be claimed, no response, bus-level failure).
 */
bool pixtend_is_transport_error (int rc);

#endif /* PIXTEND_ERRORS_H */
