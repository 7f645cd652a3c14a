/*
 * errors.cpp -- Status code messages
 */

#include "errors.h"

const char *
pixtend_strerror (int rc)
{
  switch (rc)
    {
    case PIXTEND_OK:
      return "success";
    case PIXTEND_ERR_INVALID_CHANNEL:
      return "invalid channel";
    case PIXTEND_ERR_OUT_OF_RANGE:
      return "value out of range";
    case PIXTEND_ERR_UNSAFE_VALUE:
      return "value rejected by safemode bounds";
    case PIXTEND_ERR_INVALID_MODE:
      return "channel not configured for this operation";
    case PIXTEND_ERR_PULLUP_DISABLED:
      return "GPIO pull-ups not globally enabled";
    case PIXTEND_ERR_RETAIN_DISABLED:
      return "retain memory not enabled";
    case PIXTEND_ERR_TRANSPORT_UNAVAILABLE:
      return "transport could not be opened";
    case PIXTEND_ERR_TRANSPORT_TIMEOUT:
      return "no response from board";
    case PIXTEND_ERR_BUS:
      return "bus error";
    case PIXTEND_ERR_CHECKSUM:
      return "checksum mismatch in received frame";
    case PIXTEND_ERR_LENGTH:
      return "received frame has wrong length";
    case PIXTEND_ERR_MODEL_MISMATCH:
      return "connected board is not a PiXtend V2 -L-";
    case PIXTEND_ERR_BOARD_CRC:
      return "board reports CRC error in output frame";
    case PIXTEND_ERR_BOARD_FRAME_SHORT:
      return "board reports output frame too short";
    case PIXTEND_ERR_BOARD_MODEL:
      return "board reports model mismatch in output frame";
    case PIXTEND_ERR_BOARD_SPI_SPEED:
      return "board reports SPI clock too high";
    case PIXTEND_ERR_BOARD_FAULT:
      return "board reports unknown error";
    case PIXTEND_ERR_BOARD_NOT_RUNNING:
      return "board is in safe state, power cycle required";
    case PIXTEND_ERR_NOT_OPEN:
      return "session not open";
    case PIXTEND_ERR_NOT_SYNCHRONIZED:
      return "no input data yet, run an exchange first";
    case PIXTEND_ERR_SESSION_FAULTED:
      return "session faulted, reopen required";
    case PIXTEND_ERR_NO_SENSOR:
      return "no sensor present";
    case PIXTEND_ERR_SENSOR_PARITY:
      return "sensor payload checksum failed";
    }
  return "unknown error";
}

bool
pixtend_is_transport_error (int rc)
{
  return rc == PIXTEND_ERR_TRANSPORT_UNAVAILABLE
         || rc == PIXTEND_ERR_TRANSPORT_TIMEOUT
         || rc == PIXTEND_ERR_BUS;
}
