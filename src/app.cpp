/*
 * app.cpp -- Board application base class
 *
 * Shared setup/loop skeleton used by all board programs.
 */

#include "app.h"

#include <stdio.h>
#include <unistd.h>

#include "errors.h"
#include "log.h"

BoardApp::BoardApp (Transport &transport,
                    const struct pixtend_session_config *cfg,
                    unsigned poll_ms)
  : m_poll_ms (poll_ms),
    m_last_rc (PIXTEND_OK),
    m_session (transport, cfg),
    m_cycles (0)
{
}

/*
 * BoardApp::report -- Log a failed call once, not on every cycle it
 * keeps failing with the same code.
 */
void
BoardApp::report (const char *label, int rc)
{
  if (rc != m_last_rc && rc != PIXTEND_OK)
    log_error (label, rc);
  if (rc == PIXTEND_OK && m_last_rc != PIXTEND_OK)
    printf ("Exchange recovered\n");
  m_last_rc = rc;
}

/*
 * BoardApp::setup -- Open the session, then program-specific init.
 *
 * A failed open is logged; loop() keeps retrying.
 */
void
BoardApp::setup ()
{
  int rc = m_session.open ();
  if (rc != PIXTEND_OK)
    log_error ("open", rc);
  else
    printf ("Session open\n");

  on_init ();
}

/*
 * BoardApp::loop -- Run one exchange cycle, then wait the poll interval.
 *
 * A disconnected or faulted session is reopened instead of exchanged.
 * on_cycle runs after every successful exchange.
 */
void
BoardApp::loop ()
{
  int state = m_session.state ();
  if (state == PIXTEND_DISCONNECTED || state == PIXTEND_FAULTED)
    {
      if (state == PIXTEND_FAULTED)
        printf ("Session faulted after %u failures, reopening\n",
                m_session.fault_count ());
      int rc = m_session.open ();
      if (rc != PIXTEND_OK)
        report ("open", rc);
    }
  else
    {
      int rc = m_session.read_write ();
      report ("read_write", rc);
      if (rc == PIXTEND_OK)
        {
          m_cycles++;
          on_cycle ();
        }
    }

  usleep (m_poll_ms * 1000u);
}
