/*
 * transport.h -- Bus access used by the board session
 *
 * A Transport owns the physical connection to one board.  The session
 * only ever calls it from read_write(), one exchange at a time.
 * Implementations: SpiTransport (spidev on a Raspberry Pi) and
 * StubTransport (in-memory board for tests).
 */

#ifndef PIXTEND_TRANSPORT_H
#define PIXTEND_TRANSPORT_H

#include <stddef.h>
#include <stdint.h>

class Transport
{
public:
  virtual ~Transport () {}

  /*
   * open -- Claim the bus.  Calling open on an open transport closes
   * and reclaims it.
   *
   * Returns:
   *   PIXTEND_OK or PIXTEND_ERR_TRANSPORT_UNAVAILABLE.
   */
  virtual int open () = 0;

  /* close -- Release the bus.  Safe to call when already closed. */
  virtual void close () = 0;

  /*
   * exchange -- Send one frame and receive the board's frame.
   *
   * Args:
   *   tx:      Frame to send.
   *   tx_len:  Bytes in tx.
   *   rx:      Receive buffer.
   *   rx_size: Capacity of rx.
   *   rx_len:  Number of bytes actually received.
   *
   * Returns:
   *   PIXTEND_OK, PIXTEND_ERR_TRANSPORT_TIMEOUT (no response) or
   *   PIXTEND_ERR_BUS (bus-level failure).
   */
  virtual int exchange (const uint8_t *tx, size_t tx_len,
                        uint8_t *rx, size_t rx_size, size_t *rx_len) = 0;

  /*
   * write_dac -- Send one DAC command word.
   *
   * Returns:
   *   PIXTEND_OK or PIXTEND_ERR_BUS.
   */
  virtual int write_dac (const uint8_t *word, size_t len) = 0;
};

#endif /* PIXTEND_TRANSPORT_H */
