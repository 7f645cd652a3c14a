/*
 * app.h -- Board application base class
 *
 * Shared setup/loop skeleton for programs driving a PiXtend board.
 * The base class owns the session and runs the exchange cycle; it
 * reopens the session after a fault.  Subclasses override on_init to
 * configure outputs and on_cycle to act on each fresh snapshot.
 */

#ifndef PIXTEND_APP_H
#define PIXTEND_APP_H

#include "session.h"
#include "transport.h"

class BoardApp
{
  unsigned m_poll_ms;
  int m_last_rc;

  virtual void on_init () = 0;
  virtual void on_cycle () = 0;

  void report (const char *label, int rc);

protected:
  BoardSession m_session;
  unsigned long m_cycles;

public:
  BoardApp (Transport &transport, const struct pixtend_session_config *cfg,
            unsigned poll_ms);
  virtual ~BoardApp () {}

  void setup ();
  void loop ();
};

#endif /* PIXTEND_APP_H */
