/*
 * transport_stub.cpp -- In-memory PiXtend board for native tests
 */

#include "transport_stub.h"

#include <string.h>

#include "crc.h"
#include "errors.h"

StubTransport::StubTransport ()
  : m_open (false),
    m_open_rc (PIXTEND_OK),
    m_fail_rc (PIXTEND_OK),
    m_fail_count (0),
    m_dac_fail_rc (PIXTEND_OK),
    m_dac_fail_count (0),
    m_corrupt_count (0),
    m_reply_len (PIXTEND_FRAME_LEN),
    m_open_calls (0),
    m_exchange_calls (0),
    m_dac_calls (0),
    m_last_tx_len (0)
{
  pixtend_input_init (&m_board);
  m_board.firmware = 1;
  m_board.hardware = 21;
  memset (m_last_tx, 0, sizeof (m_last_tx));
  memset (m_dac_word, 0, sizeof (m_dac_word));
}

int
StubTransport::open ()
{
  m_open_calls++;
  if (m_open_rc != PIXTEND_OK)
    {
      m_open = false;
      return m_open_rc;
    }
  m_open = true;
  return PIXTEND_OK;
}

void
StubTransport::close ()
{
  m_open = false;
}

/* Make the next COUNT exchanges fail with RC before the board sees them. */
void
StubTransport::fail_next (int rc, unsigned count)
{
  m_fail_rc = rc;
  m_fail_count = count;
}

void
StubTransport::fail_next_dac (int rc, unsigned count)
{
  m_dac_fail_rc = rc;
  m_dac_fail_count = count;
}

/*
 * StubTransport::exchange -- Play the board's side of one cycle.
 *
 * The board judges the received frame the way the firmware does: a bad
 * length or CRC is answered with an error code and the frame is ignored.
 */
int
StubTransport::exchange (const uint8_t *tx, size_t tx_len,
                         uint8_t *rx, size_t rx_size, size_t *rx_len)
{
  m_exchange_calls++;
  *rx_len = 0;
  if (!m_open)
    return PIXTEND_ERR_BUS;

  m_last_tx_len = tx_len < sizeof (m_last_tx) ? tx_len : sizeof (m_last_tx);
  memcpy (m_last_tx, tx, m_last_tx_len);

  if (m_fail_count > 0)
    {
      m_fail_count--;
      return m_fail_rc;
    }

  struct pixtend_output out;
  pixtend_output_init (&out);
  uint8_t error_code = PIXTEND_BOARD_OK;
  int rc = pixtend_decode_output (tx, tx_len, &out);
  if (rc == PIXTEND_ERR_LENGTH)
    error_code = PIXTEND_BOARD_DATA_SHORT;
  else if (rc != PIXTEND_OK)
    error_code = pixtend_crc_verify (tx, PIXTEND_HEADER_LEN)
                 ? PIXTEND_BOARD_DATA_CRC : PIXTEND_BOARD_HEADER_CRC;
  else if (tx[PIXTEND_OUT_MODEL] != PIXTEND_MODEL_L)
    error_code = PIXTEND_BOARD_MODEL;
  else
    {
      if (out.system & PIXTEND_SYS_RETAIN_ENABLE)
        memcpy (m_board.retain, out.retain, sizeof (m_board.retain));
      if (out.system & PIXTEND_SYS_SAFE)
        m_board.run = false;
    }

  struct pixtend_input reply = m_board;
  if (error_code != PIXTEND_BOARD_OK)
    reply.error_code = error_code;

  uint8_t frame[2 * PIXTEND_FRAME_LEN];
  memset (frame, 0, sizeof (frame));
  pixtend_encode_input (&reply, frame);
  if (m_corrupt_count > 0)
    {
      m_corrupt_count--;
      frame[PIXTEND_IN_DIGITAL] ^= 0x01;
    }

  size_t n = m_reply_len;
  if (n > sizeof (frame))
    n = sizeof (frame);
  if (n > rx_size)
    n = rx_size;
  memcpy (rx, frame, n);
  *rx_len = n;
  return PIXTEND_OK;
}

int
StubTransport::write_dac (const uint8_t *word, size_t len)
{
  m_dac_calls++;
  if (!m_open)
    return PIXTEND_ERR_BUS;
  if (m_dac_fail_count > 0)
    {
      m_dac_fail_count--;
      return m_dac_fail_rc;
    }

  unsigned channel;
  struct pixtend_dac_channel dac;
  int rc = pixtend_decode_dac (word, len, &channel, &dac);
  if (rc != PIXTEND_OK)
    return PIXTEND_ERR_BUS;
  memcpy (m_dac_word[channel], word, PIXTEND_DAC_WORD_LEN);
  return PIXTEND_OK;
}

/* Last DAC word written to CHANNEL (zeros before the first write). */
const uint8_t *
StubTransport::dac_word (unsigned channel) const
{
  return m_dac_word[channel];
}

/* Decode the last frame the board received. */
int
StubTransport::last_output (struct pixtend_output *out) const
{
  pixtend_output_init (out);
  return pixtend_decode_output (m_last_tx, m_last_tx_len, out);
}
