/*
 * transport_stub.h -- In-memory PiXtend board for native tests
 *
 * Answers every exchange with a valid input frame built from board(),
 * the simulated board state.  Retain-enabled frames are stored in the
 * board's retain memory and echoed in the same reply.  A frame with the
 * SAFE bit set stops the board (RUN cleared).  Failures and corrupted
 * replies can be scripted.
 */

#ifndef PIXTEND_TRANSPORT_STUB_H
#define PIXTEND_TRANSPORT_STUB_H

#include "protocol.h"
#include "transport.h"

class StubTransport : public Transport
{
  bool m_open;
  int m_open_rc;
  int m_fail_rc;
  unsigned m_fail_count;
  int m_dac_fail_rc;
  unsigned m_dac_fail_count;
  unsigned m_corrupt_count;
  size_t m_reply_len;

  struct pixtend_input m_board;

  unsigned m_open_calls;
  unsigned m_exchange_calls;
  unsigned m_dac_calls;
  uint8_t m_last_tx[PIXTEND_FRAME_LEN];
  size_t m_last_tx_len;
  uint8_t m_dac_word[PIXTEND_NUM_ANALOG_OUT][PIXTEND_DAC_WORD_LEN];

public:
  StubTransport ();

  int open () override;
  void close () override;
  int exchange (const uint8_t *tx, size_t tx_len,
                uint8_t *rx, size_t rx_size, size_t *rx_len) override;
  int write_dac (const uint8_t *word, size_t len) override;

  /* Scripting */
  void set_open_result (int rc) { m_open_rc = rc; }
  void fail_next (int rc, unsigned count);
  void fail_next_dac (int rc, unsigned count);
  void corrupt_next (unsigned count) { m_corrupt_count = count; }
  void set_reply_len (size_t len) { m_reply_len = len; }
  struct pixtend_input &board () { return m_board; }

  /* Inspection */
  bool is_open () const { return m_open; }
  unsigned open_calls () const { return m_open_calls; }
  unsigned exchange_calls () const { return m_exchange_calls; }
  unsigned dac_calls () const { return m_dac_calls; }
  const uint8_t *last_tx () const { return m_last_tx; }
  const uint8_t *dac_word (unsigned channel) const;
  int last_output (struct pixtend_output *out) const;
};

#endif /* PIXTEND_TRANSPORT_STUB_H */
