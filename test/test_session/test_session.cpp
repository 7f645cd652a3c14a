/*
 * test_session.cpp -- Unity tests for the board session state machine,
 * setters, getters and safemode, run against the in-memory stub board.
 *
 * Run with: ctest -R test_session
 */

#include <string.h>
#include <unity.h>

#include "errors.h"
#include "session.h"
#include "transport_stub.h"

void
setUp (void)
{
}

void
tearDown (void)
{
}

/* Open SESSION and run one good exchange. */
static void
open_and_sync (BoardSession &session)
{
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.open ());
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.read_write ());
}

/* Decode the frame the stub board received last. */
static void
last_output (const StubTransport &stub, struct pixtend_output *out)
{
  TEST_ASSERT_EQUAL (PIXTEND_OK, stub.last_output (out));
}

/* -- Lifecycle ------------------------------------------------------------ */

void
test_new_session_is_disconnected (void)
{
  StubTransport stub;
  BoardSession session (stub);
  TEST_ASSERT_EQUAL (PIXTEND_DISCONNECTED, session.state ());
  TEST_ASSERT_EQUAL (PIXTEND_ERR_NOT_OPEN, session.read_write ());
  TEST_ASSERT_EQUAL (0, stub.exchange_calls ());
  TEST_ASSERT_EQUAL (0, stub.dac_calls ());
}

void
test_open_failure_reported (void)
{
  StubTransport stub;
  BoardSession session (stub);
  stub.set_open_result (PIXTEND_ERR_TRANSPORT_UNAVAILABLE);
  TEST_ASSERT_EQUAL (PIXTEND_ERR_TRANSPORT_UNAVAILABLE, session.open ());
  TEST_ASSERT_EQUAL (PIXTEND_DISCONNECTED, session.state ());
  TEST_ASSERT_EQUAL (PIXTEND_ERR_NOT_OPEN, session.read_write ());
}

void
test_open_moves_to_connected (void)
{
  StubTransport stub;
  BoardSession session (stub);
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.open ());
  TEST_ASSERT_EQUAL (PIXTEND_CONNECTED, session.state ());
  TEST_ASSERT_TRUE (stub.is_open ());
  TEST_ASSERT_EQUAL (0, session.sequence ());
}

void
test_getters_before_exchange_not_synchronized (void)
{
  StubTransport stub;
  BoardSession session (stub);
  bool on;
  double value;
  uint16_t raw;
  uint8_t byte;
  uint8_t retain[PIXTEND_RETAIN_LEN];
  struct pixtend_board_status st;

  TEST_ASSERT_EQUAL (PIXTEND_OK, session.open ());
  TEST_ASSERT_EQUAL (PIXTEND_ERR_NOT_SYNCHRONIZED,
                     session.read_digital_input (0, &on));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_NOT_SYNCHRONIZED,
                     session.read_analog_input (0, &value));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_NOT_SYNCHRONIZED,
                     session.read_analog_raw (0, &raw));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_NOT_SYNCHRONIZED,
                     session.read_gpio_input (0, &on));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_NOT_SYNCHRONIZED,
                     session.read_retain (retain, sizeof (retain)));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_NOT_SYNCHRONIZED,
                     session.firmware_version (&byte));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_NOT_SYNCHRONIZED,
                     session.hardware_version (&byte));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_NOT_SYNCHRONIZED,
                     session.board_status (&st));
  TEST_ASSERT_EQUAL (0, stub.exchange_calls ());
}

void
test_exchange_synchronizes (void)
{
  StubTransport stub;
  BoardSession session (stub);
  uint8_t fw = 0, hw = 0, model = 0;

  open_and_sync (session);
  TEST_ASSERT_EQUAL (PIXTEND_SYNCHRONIZED, session.state ());
  TEST_ASSERT_EQUAL (1, session.sequence ());
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.firmware_version (&fw));
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.hardware_version (&hw));
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.board_model (&model));
  TEST_ASSERT_EQUAL (1, fw);
  TEST_ASSERT_EQUAL (21, hw);
  TEST_ASSERT_EQUAL ('L', model);
}

void
test_close_stops_exchanges (void)
{
  StubTransport stub;
  BoardSession session (stub);

  open_and_sync (session);
  session.close ();
  TEST_ASSERT_FALSE (stub.is_open ());
  TEST_ASSERT_EQUAL (PIXTEND_DISCONNECTED, session.state ());
  TEST_ASSERT_EQUAL (PIXTEND_ERR_NOT_OPEN, session.read_write ());
}

void
test_destructor_releases_transport (void)
{
  StubTransport local;
  {
    BoardSession s (local);
    TEST_ASSERT_EQUAL (PIXTEND_OK, s.open ());
    TEST_ASSERT_TRUE (local.is_open ());
  }
  TEST_ASSERT_FALSE (local.is_open ());
}

void
test_sequence_counts_bus_exchanges (void)
{
  StubTransport stub;
  BoardSession session (stub);

  open_and_sync (session);
  stub.fail_next (PIXTEND_ERR_TRANSPORT_TIMEOUT, 1);
  TEST_ASSERT_EQUAL (PIXTEND_ERR_TRANSPORT_TIMEOUT, session.read_write ());
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.read_write ());
  TEST_ASSERT_EQUAL (3, session.sequence ());
}

/* -- Digital I/O ---------------------------------------------------------- */

void
test_digital_output_reaches_frame (void)
{
  StubTransport stub;
  BoardSession session (stub);
  struct pixtend_output out;

  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_digital_output (3, true));
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_digital_output (11, true));
  open_and_sync (session);
  last_output (stub, &out);
  TEST_ASSERT_EQUAL_HEX16 (0x0808, out.digital_out);
}

void
test_outputs_latch_across_cycles (void)
{
  StubTransport stub;
  BoardSession session (stub);
  struct pixtend_output out;

  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_relay_output (2, true));
  open_and_sync (session);
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.read_write ());
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.read_write ());
  last_output (stub, &out);
  TEST_ASSERT_EQUAL_HEX8 (0x04, out.relay_out);
}

void
test_setter_invalid_channel_leaves_state (void)
{
  StubTransport stub;
  BoardSession session (stub);
  TEST_ASSERT_EQUAL (PIXTEND_ERR_INVALID_CHANNEL,
                     session.set_digital_output (12, true));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_INVALID_CHANNEL,
                     session.set_relay_output (4, true));
  TEST_ASSERT_EQUAL_HEX16 (0, session.pending_output ().digital_out);
  TEST_ASSERT_EQUAL_HEX8 (0, session.pending_output ().relay_out);
}

void
test_digital_input_from_snapshot (void)
{
  StubTransport stub;
  BoardSession session (stub);
  bool on;

  stub.board ().digital_in = 0x8001;
  open_and_sync (session);
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.read_digital_input (0, &on));
  TEST_ASSERT_TRUE (on);
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.read_digital_input (1, &on));
  TEST_ASSERT_FALSE (on);
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.read_digital_input (15, &on));
  TEST_ASSERT_TRUE (on);
  TEST_ASSERT_EQUAL (PIXTEND_ERR_INVALID_CHANNEL,
                     session.read_digital_input (16, &on));
}

/* -- Analog I/O ----------------------------------------------------------- */

void
test_analog_input_modes (void)
{
  StubTransport stub;
  BoardSession session (stub);
  double value;
  uint16_t raw;

  stub.board ().analog_in[0] = 512;
  stub.board ().analog_in[4] = 992;
  open_and_sync (session);

  TEST_ASSERT_EQUAL (PIXTEND_OK, session.read_analog_input (0, &value));
  TEST_ASSERT_FLOAT_WITHIN (1e-6f, 5.0f, (float) value);
  TEST_ASSERT_EQUAL (PIXTEND_OK,
                     session.set_analog_input_mode (0, PIXTEND_ANALOG_5V));
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.read_analog_input (0, &value));
  TEST_ASSERT_FLOAT_WITHIN (1e-6f, 2.5f, (float) value);

  TEST_ASSERT_EQUAL (PIXTEND_OK, session.read_analog_input (4, &value));
  TEST_ASSERT_FLOAT_WITHIN (1e-4f, 19.9971f, (float) value);
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.read_analog_raw (4, &raw));
  TEST_ASSERT_EQUAL (992, raw);

  TEST_ASSERT_EQUAL (PIXTEND_ERR_INVALID_MODE,
                     session.set_analog_input_mode (4, PIXTEND_ANALOG_10V));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_INVALID_CHANNEL,
                     session.read_analog_input (6, &value));
}

void
test_analog_output_sends_dac_words (void)
{
  StubTransport stub;
  BoardSession session (stub);
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_analog_output (1, 5.33));
  open_and_sync (session);

  TEST_ASSERT_EQUAL (2, stub.dac_calls ());
  TEST_ASSERT_EQUAL_HEX8 (0x98, stub.dac_word (1)[0]);
  TEST_ASSERT_EQUAL_HEX8 (0x84, stub.dac_word (1)[1]);
  TEST_ASSERT_EQUAL_HEX8 (0x00, stub.dac_word (0)[0]);
  TEST_ASSERT_EQUAL_HEX8 (0x00, stub.dac_word (0)[1]);
}

void
test_analog_output_rejects_bad_values (void)
{
  StubTransport stub;
  BoardSession session (stub);
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_analog_output (0, 3.0));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_OUT_OF_RANGE,
                     session.set_analog_output (0, 10.5));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_OUT_OF_RANGE,
                     session.set_analog_output (0, -1.0));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_INVALID_CHANNEL,
                     session.set_analog_output (2, 1.0));
  /* 3.0 V = trunc (306.9) */
  TEST_ASSERT_EQUAL (306, session.pending_output ().dac[0].value);
}

void
test_disable_analog_output (void)
{
  StubTransport stub;
  BoardSession session (stub);
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_analog_output (0, 10.0));
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.disable_analog_output (0));
  open_and_sync (session);
  /* Disabled channel A keeps its value bits, enable bit cleared */
  TEST_ASSERT_EQUAL_HEX8 (0x0F, stub.dac_word (0)[0]);
  TEST_ASSERT_EQUAL_HEX8 (0xFC, stub.dac_word (0)[1]);
  TEST_ASSERT_EQUAL (PIXTEND_ERR_INVALID_CHANNEL,
                     session.disable_analog_output (2));
}

/* -- Safemode ------------------------------------------------------------- */

void
test_safemode_rejects_unsafe_analog (void)
{
  StubTransport stub;
  BoardSession session (stub);
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_analog_output (1, 2.0));
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_analog_safe_bounds (1, 0.0, 5.0));
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_safemode (true));

  TEST_ASSERT_EQUAL (PIXTEND_ERR_UNSAFE_VALUE,
                     session.set_analog_output (1, 7.0));
  TEST_ASSERT_TRUE (session.pending_output ().dac[1].enabled);
  TEST_ASSERT_EQUAL (204, session.pending_output ().dac[1].value);

  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_analog_output (1, 5.0));
  TEST_ASSERT_EQUAL (511, session.pending_output ().dac[1].value);
}

void
test_safemode_enable_rejected_when_pending_unsafe (void)
{
  StubTransport stub;
  BoardSession session (stub);
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_digital_output (2, true));
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_digital_safe (2, false));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_UNSAFE_VALUE, session.set_safemode (true));
  TEST_ASSERT_FALSE (session.safemode ());

  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_digital_output (2, false));
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_safemode (true));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_UNSAFE_VALUE,
                     session.set_digital_output (2, true));
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_digital_output (3, true));
  TEST_ASSERT_EQUAL_HEX16 (0x0008, session.pending_output ().digital_out);
}

void
test_safemode_tightening_bound_rejected (void)
{
  StubTransport stub;
  BoardSession session (stub);
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_safemode (true));
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_analog_output (0, 8.0));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_UNSAFE_VALUE,
                     session.set_analog_safe_bounds (0, 0.0, 5.0));

  /* Switching the output off is always allowed */
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.disable_analog_output (0));
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_analog_safe_bounds (0, 0.0, 5.0));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_UNSAFE_VALUE,
                     session.set_analog_output (0, 6.0));

  TEST_ASSERT_EQUAL (PIXTEND_ERR_OUT_OF_RANGE,
                     session.set_analog_safe_bounds (0, 6.0, 5.0));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_OUT_OF_RANGE,
                     session.set_analog_safe_bounds (0, 0.0, 11.0));
}

void
test_safemode_relay_and_gpio (void)
{
  StubTransport stub;
  BoardSession session (stub);
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_safemode (true));

  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_relay_safe (1, false));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_UNSAFE_VALUE,
                     session.set_relay_output (1, true));
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_relay_output (1, false));

  TEST_ASSERT_EQUAL (PIXTEND_OK,
                     session.set_gpio_mode (0, PIXTEND_GPIO_OUTPUT));
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_gpio_output (0, true));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_UNSAFE_VALUE, session.set_gpio_safe (0, false));
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_gpio_output (0, false));
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_gpio_safe (0, false));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_UNSAFE_VALUE,
                     session.set_gpio_output (0, true));
}

void
test_safemode_is_not_board_safe_state (void)
{
  StubTransport stub;
  BoardSession session (stub);
  struct pixtend_output out;

  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_safemode (true));
  open_and_sync (session);
  last_output (stub, &out);
  TEST_ASSERT_EQUAL_HEX8 (0, out.system & PIXTEND_SYS_SAFE);
}

/* -- Fault handling ------------------------------------------------------- */

void
test_three_timeouts_fault_session (void)
{
  StubTransport stub;
  BoardSession session (stub);
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.open ());
  stub.fail_next (PIXTEND_ERR_TRANSPORT_TIMEOUT, 3);

  TEST_ASSERT_EQUAL (PIXTEND_ERR_TRANSPORT_TIMEOUT, session.read_write ());
  TEST_ASSERT_EQUAL (PIXTEND_CONNECTED, session.state ());
  TEST_ASSERT_EQUAL (PIXTEND_ERR_TRANSPORT_TIMEOUT, session.read_write ());
  TEST_ASSERT_EQUAL (PIXTEND_CONNECTED, session.state ());
  TEST_ASSERT_EQUAL (PIXTEND_ERR_TRANSPORT_TIMEOUT, session.read_write ());
  TEST_ASSERT_EQUAL (PIXTEND_FAULTED, session.state ());
  TEST_ASSERT_EQUAL (3, session.fault_count ());

  unsigned exchanges = stub.exchange_calls ();
  unsigned dac_writes = stub.dac_calls ();
  TEST_ASSERT_EQUAL (PIXTEND_ERR_SESSION_FAULTED, session.read_write ());
  TEST_ASSERT_EQUAL (exchanges, stub.exchange_calls ());
  TEST_ASSERT_EQUAL (dac_writes, stub.dac_calls ());
}

void
test_reopen_after_fault (void)
{
  StubTransport stub;
  BoardSession session (stub);
  struct pixtend_output out;
  bool on;

  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_digital_output (5, true));
  open_and_sync (session);
  stub.fail_next (PIXTEND_ERR_BUS, 3);
  session.read_write ();
  session.read_write ();
  session.read_write ();
  TEST_ASSERT_EQUAL (PIXTEND_FAULTED, session.state ());

  TEST_ASSERT_EQUAL (PIXTEND_OK, session.open ());
  TEST_ASSERT_EQUAL (PIXTEND_CONNECTED, session.state ());
  TEST_ASSERT_EQUAL (0, session.fault_count ());
  TEST_ASSERT_EQUAL (0, session.sequence ());
  TEST_ASSERT_EQUAL (PIXTEND_ERR_NOT_SYNCHRONIZED,
                     session.read_digital_input (0, &on));

  TEST_ASSERT_EQUAL (PIXTEND_OK, session.read_write ());
  last_output (stub, &out);
  TEST_ASSERT_EQUAL_HEX16 (0x0020, out.digital_out);
}

void
test_getters_work_while_faulted (void)
{
  StubTransport stub;
  BoardSession session (stub);
  bool on;

  stub.board ().digital_in = 0x0001;
  open_and_sync (session);
  stub.fail_next (PIXTEND_ERR_TRANSPORT_TIMEOUT, 3);
  session.read_write ();
  session.read_write ();
  session.read_write ();
  TEST_ASSERT_EQUAL (PIXTEND_FAULTED, session.state ());
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.read_digital_input (0, &on));
  TEST_ASSERT_TRUE (on);
}

void
test_checksum_error_keeps_snapshot (void)
{
  StubTransport stub;
  BoardSession session (stub);
  bool on;

  stub.board ().digital_in = 0x0001;
  open_and_sync (session);
  stub.board ().digital_in = 0x0002;
  stub.corrupt_next (1);

  TEST_ASSERT_EQUAL (PIXTEND_ERR_CHECKSUM, session.read_write ());
  TEST_ASSERT_EQUAL (PIXTEND_SYNCHRONIZED, session.state ());
  TEST_ASSERT_EQUAL (1, session.fault_count ());
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.read_digital_input (0, &on));
  TEST_ASSERT_TRUE (on);

  TEST_ASSERT_EQUAL (PIXTEND_OK, session.read_write ());
  TEST_ASSERT_EQUAL (0, session.fault_count ());
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.read_digital_input (1, &on));
  TEST_ASSERT_TRUE (on);
}

void
test_first_checksum_error_never_faults (void)
{
  StubTransport local;
  struct pixtend_session_config cfg;
  pixtend_session_config_init (&cfg);
  cfg.fault_threshold = 1;
  BoardSession s (local, &cfg);

  TEST_ASSERT_EQUAL (PIXTEND_OK, s.open ());
  local.corrupt_next (2);
  TEST_ASSERT_EQUAL (PIXTEND_ERR_CHECKSUM, s.read_write ());
  TEST_ASSERT_EQUAL (PIXTEND_CONNECTED, s.state ());
  TEST_ASSERT_EQUAL (PIXTEND_ERR_CHECKSUM, s.read_write ());
  TEST_ASSERT_EQUAL (PIXTEND_FAULTED, s.state ());
}

void
test_transport_error_faults_at_threshold_one (void)
{
  StubTransport local;
  struct pixtend_session_config cfg;
  pixtend_session_config_init (&cfg);
  cfg.fault_threshold = 1;
  BoardSession s (local, &cfg);

  TEST_ASSERT_EQUAL (PIXTEND_OK, s.open ());
  local.fail_next (PIXTEND_ERR_BUS, 1);
  TEST_ASSERT_EQUAL (PIXTEND_ERR_BUS, s.read_write ());
  TEST_ASSERT_EQUAL (PIXTEND_FAULTED, s.state ());
}

void
test_repeated_checksum_errors_fault (void)
{
  StubTransport stub;
  BoardSession session (stub);
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.open ());
  stub.corrupt_next (3);
  session.read_write ();
  session.read_write ();
  TEST_ASSERT_EQUAL (PIXTEND_CONNECTED, session.state ());
  TEST_ASSERT_EQUAL (PIXTEND_ERR_CHECKSUM, session.read_write ());
  TEST_ASSERT_EQUAL (PIXTEND_FAULTED, session.state ());
}

void
test_mixed_failures_share_counter (void)
{
  StubTransport stub;
  BoardSession session (stub);
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.open ());
  stub.fail_next (PIXTEND_ERR_TRANSPORT_TIMEOUT, 1);
  TEST_ASSERT_EQUAL (PIXTEND_ERR_TRANSPORT_TIMEOUT, session.read_write ());
  stub.corrupt_next (2);
  TEST_ASSERT_EQUAL (PIXTEND_ERR_CHECKSUM, session.read_write ());
  TEST_ASSERT_EQUAL (PIXTEND_ERR_CHECKSUM, session.read_write ());
  TEST_ASSERT_EQUAL (PIXTEND_FAULTED, session.state ());
}

void
test_success_resets_fault_counter (void)
{
  StubTransport stub;
  BoardSession session (stub);
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.open ());
  stub.fail_next (PIXTEND_ERR_TRANSPORT_TIMEOUT, 2);
  session.read_write ();
  session.read_write ();
  TEST_ASSERT_EQUAL (2, session.fault_count ());
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.read_write ());
  TEST_ASSERT_EQUAL (0, session.fault_count ());
  stub.fail_next (PIXTEND_ERR_TRANSPORT_TIMEOUT, 2);
  session.read_write ();
  session.read_write ();
  TEST_ASSERT_EQUAL (PIXTEND_SYNCHRONIZED, session.state ());
}

void
test_wrong_reply_length (void)
{
  StubTransport stub;
  BoardSession session (stub);
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.open ());
  stub.set_reply_len (PIXTEND_FRAME_LEN - 1);
  TEST_ASSERT_EQUAL (PIXTEND_ERR_LENGTH, session.read_write ());
  stub.set_reply_len (PIXTEND_FRAME_LEN + 1);
  TEST_ASSERT_EQUAL (PIXTEND_ERR_LENGTH, session.read_write ());
}

void
test_model_mismatch (void)
{
  StubTransport stub;
  BoardSession session (stub);
  uint8_t fw;

  stub.board ().model = 'B';
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.open ());
  TEST_ASSERT_EQUAL (PIXTEND_ERR_MODEL_MISMATCH, session.read_write ());
  TEST_ASSERT_EQUAL (PIXTEND_ERR_NOT_SYNCHRONIZED,
                     session.firmware_version (&fw));
}

void
test_failed_dac_write_keeps_snapshot (void)
{
  StubTransport stub;
  BoardSession session (stub);
  bool on;

  stub.board ().digital_in = 0x0001;
  open_and_sync (session);
  unsigned exchanges = stub.exchange_calls ();

  stub.board ().digital_in = 0x0000;
  stub.fail_next_dac (PIXTEND_ERR_BUS, 1);
  TEST_ASSERT_EQUAL (PIXTEND_ERR_BUS, session.read_write ());
  TEST_ASSERT_EQUAL (exchanges, stub.exchange_calls ());
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.read_digital_input (0, &on));
  TEST_ASSERT_TRUE (on);
}

/* -- Board-reported state ------------------------------------------------- */

void
test_board_error_codes (void)
{
  static const struct
  {
    uint8_t code;
    int rc;
  } cases[] = {
    {PIXTEND_BOARD_DATA_CRC, PIXTEND_ERR_BOARD_CRC},
    {PIXTEND_BOARD_HEADER_CRC, PIXTEND_ERR_BOARD_CRC},
    {PIXTEND_BOARD_DATA_SHORT, PIXTEND_ERR_BOARD_FRAME_SHORT},
    {PIXTEND_BOARD_MODEL, PIXTEND_ERR_BOARD_MODEL},
    {PIXTEND_BOARD_SPI_SPEED, PIXTEND_ERR_BOARD_SPI_SPEED},
    {9, PIXTEND_ERR_BOARD_FAULT},
  };
  StubTransport local;
  struct pixtend_session_config cfg;
  pixtend_session_config_init (&cfg);
  cfg.fault_threshold = 100;
  BoardSession s (local, &cfg);
  bool on;

  local.board ().digital_in = 0x0001;
  TEST_ASSERT_EQUAL (PIXTEND_OK, s.open ());
  TEST_ASSERT_EQUAL (PIXTEND_OK, s.read_write ());

  local.board ().digital_in = 0x0000;
  for (size_t i = 0; i < sizeof (cases) / sizeof (cases[0]); i++)
    {
      local.board ().error_code = cases[i].code;
      TEST_ASSERT_EQUAL (cases[i].rc, s.read_write ());
    }
  /* Frames carrying a board error are not trusted */
  TEST_ASSERT_EQUAL (PIXTEND_OK, s.read_digital_input (0, &on));
  TEST_ASSERT_TRUE (on);
}

void
test_board_judges_corrupt_output_frame (void)
{
  StubTransport stub;

  /* The stub board flags a short frame the way the firmware does */
  uint8_t tx[10] = {0};
  uint8_t rx[PIXTEND_FRAME_LEN];
  size_t rx_len;
  struct pixtend_input in;

  TEST_ASSERT_EQUAL (PIXTEND_OK, stub.open ());
  TEST_ASSERT_EQUAL (PIXTEND_OK, stub.exchange (tx, sizeof (tx), rx,
                                                 sizeof (rx), &rx_len));
  TEST_ASSERT_EQUAL (PIXTEND_OK, pixtend_decode_input (rx, rx_len, &in));
  TEST_ASSERT_EQUAL (PIXTEND_BOARD_DATA_SHORT, in.error_code);
}

void
test_safe_state_request_stops_board (void)
{
  StubTransport stub;
  BoardSession session (stub);
  struct pixtend_board_status st;
  struct pixtend_output out;

  session.request_safe_state (true);
  open_and_sync (session);
  last_output (stub, &out);
  TEST_ASSERT_EQUAL_HEX8 (PIXTEND_SYS_SAFE, out.system & PIXTEND_SYS_SAFE);

  TEST_ASSERT_EQUAL (PIXTEND_OK, session.board_status (&st));
  TEST_ASSERT_FALSE (st.run);
  TEST_ASSERT_TRUE (st.safe_requested);
  TEST_ASSERT_FALSE (st.watchdog_expired);

  unsigned exchanges = stub.exchange_calls ();
  unsigned long seq = session.sequence ();
  TEST_ASSERT_EQUAL (PIXTEND_ERR_BOARD_NOT_RUNNING, session.read_write ());
  TEST_ASSERT_EQUAL (exchanges, stub.exchange_calls ());
  TEST_ASSERT_EQUAL (seq, session.sequence ());
}

void
test_watchdog_expired_flag (void)
{
  StubTransport stub;
  BoardSession session (stub);
  struct pixtend_board_status st;
  struct pixtend_output out;

  TEST_ASSERT_EQUAL (PIXTEND_OK,
                     session.set_watchdog_period (PIXTEND_WATCHDOG_125MS));
  open_and_sync (session);
  last_output (stub, &out);
  TEST_ASSERT_EQUAL (4, out.watchdog);
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.board_status (&st));
  TEST_ASSERT_TRUE (st.run);
  TEST_ASSERT_FALSE (st.watchdog_expired);

  stub.board ().run = false;
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.read_write ());
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.board_status (&st));
  TEST_ASSERT_FALSE (st.run);
  TEST_ASSERT_TRUE (st.watchdog_expired);
}

void
test_watchdog_period_range (void)
{
  StubTransport stub;
  BoardSession session (stub);
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_watchdog_period (PIXTEND_WATCHDOG_8S));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_OUT_OF_RANGE,
                     session.set_watchdog_period (PIXTEND_WATCHDOG_MAX + 1));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_OUT_OF_RANGE, session.set_watchdog_period (-1));
  TEST_ASSERT_EQUAL (PIXTEND_WATCHDOG_8S, session.pending_output ().watchdog);
}

void
test_board_warnings_reported (void)
{
  StubTransport stub;
  BoardSession session (stub);
  struct pixtend_board_status st;

  stub.board ().warnings = PIXTEND_WARN_RETAIN_CRC | PIXTEND_WARN_I2C;
  open_and_sync (session);
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.board_status (&st));
  TEST_ASSERT_EQUAL_HEX8 (0x0A, st.warnings);
  TEST_ASSERT_EQUAL (PIXTEND_BOARD_OK, st.error_code);
}

/* -- Retain memory -------------------------------------------------------- */

void
test_retain_round_trip (void)
{
  StubTransport stub;
  BoardSession session (stub);
  uint8_t block[PIXTEND_RETAIN_LEN];
  uint8_t back[PIXTEND_RETAIN_LEN];

  for (int i = 0; i < PIXTEND_RETAIN_LEN; i++)
    block[i] = (uint8_t) (i * 7 + 3);
  session.set_retain_enable (true);
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.write_retain (block, sizeof (block)));
  open_and_sync (session);
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.read_retain (back, sizeof (back)));
  TEST_ASSERT_EQUAL_HEX8_ARRAY (block, back, PIXTEND_RETAIN_LEN);
}

void
test_retain_requires_enable (void)
{
  StubTransport stub;
  BoardSession session (stub);
  uint8_t block[4] = {1, 2, 3, 4};
  TEST_ASSERT_EQUAL (PIXTEND_ERR_RETAIN_DISABLED,
                     session.write_retain (block, sizeof (block)));
  TEST_ASSERT_EQUAL_HEX8 (0, session.pending_output ().retain[0]);
}

void
test_retain_block_padding_and_limit (void)
{
  StubTransport stub;
  BoardSession session (stub);
  uint8_t full[PIXTEND_RETAIN_LEN + 1];
  uint8_t part[3] = {0x11, 0x22, 0x33};

  memset (full, 0xFF, sizeof (full));
  session.set_retain_enable (true);
  TEST_ASSERT_EQUAL (PIXTEND_ERR_OUT_OF_RANGE,
                     session.write_retain (full, sizeof (full)));
  TEST_ASSERT_EQUAL (PIXTEND_OK,
                     session.write_retain (full, PIXTEND_RETAIN_LEN));
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.write_retain (part, sizeof (part)));

  const uint8_t *retain = session.pending_output ().retain;
  TEST_ASSERT_EQUAL_HEX8 (0x11, retain[0]);
  TEST_ASSERT_EQUAL_HEX8 (0x33, retain[2]);
  TEST_ASSERT_EQUAL_HEX8 (0x00, retain[3]);
  TEST_ASSERT_EQUAL_HEX8 (0x00, retain[PIXTEND_RETAIN_LEN - 1]);
}

/* -- GPIO and sensors ----------------------------------------------------- */

void
test_gpio_modes_and_pullups (void)
{
  StubTransport stub;
  BoardSession session (stub);
  struct pixtend_output out;

  TEST_ASSERT_EQUAL (PIXTEND_ERR_PULLUP_DISABLED,
                     session.set_gpio_mode (1, PIXTEND_GPIO_INPUT_PULLUP));
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_gpio_pullup_enable (true));
  TEST_ASSERT_EQUAL (PIXTEND_OK,
                     session.set_gpio_mode (1, PIXTEND_GPIO_INPUT_PULLUP));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_INVALID_MODE,
                     session.set_gpio_pullup_enable (false));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_INVALID_MODE,
                     session.set_gpio_output (1, true));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_INVALID_MODE, session.set_gpio_mode (0, 9));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_INVALID_CHANNEL,
                     session.set_gpio_mode (4, PIXTEND_GPIO_INPUT));

  TEST_ASSERT_EQUAL (PIXTEND_OK,
                     session.set_gpio_mode (0, PIXTEND_GPIO_OUTPUT));
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_gpio_output (0, true));
  open_and_sync (session);
  last_output (stub, &out);
  TEST_ASSERT_EQUAL (PIXTEND_GPIO_OUTPUT, out.gpio_mode[0]);
  TEST_ASSERT_EQUAL (PIXTEND_GPIO_INPUT_PULLUP, out.gpio_mode[1]);
  TEST_ASSERT_EQUAL_HEX8 (0x01, out.gpio_level);
  TEST_ASSERT_EQUAL_HEX8 (PIXTEND_SYS_GPIO_PULLUP,
                          out.system & PIXTEND_SYS_GPIO_PULLUP);
}

void
test_leaving_output_mode_drops_level (void)
{
  StubTransport stub;
  BoardSession session (stub);
  TEST_ASSERT_EQUAL (PIXTEND_OK,
                     session.set_gpio_mode (2, PIXTEND_GPIO_OUTPUT));
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_gpio_output (2, true));
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_gpio_mode (2, PIXTEND_GPIO_INPUT));
  TEST_ASSERT_EQUAL_HEX8 (0, session.pending_output ().gpio_level);
}

void
test_gpio_input_read (void)
{
  StubTransport stub;
  BoardSession session (stub);
  bool on;

  stub.board ().gpio_in = 0x02;
  open_and_sync (session);
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.read_gpio_input (1, &on));
  TEST_ASSERT_TRUE (on);
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.read_gpio_input (0, &on));
  TEST_ASSERT_FALSE (on);
  TEST_ASSERT_EQUAL (PIXTEND_OK,
                     session.set_gpio_mode (2, PIXTEND_GPIO_OUTPUT));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_INVALID_MODE,
                     session.read_gpio_input (2, &on));
}

void
test_sensor_read (void)
{
  StubTransport stub;
  BoardSession session (stub);
  struct pixtend_sensor_reading r;

  TEST_ASSERT_EQUAL (PIXTEND_OK,
                     session.set_gpio_mode (0, PIXTEND_GPIO_SENSOR));
  stub.board ().sensor[0].temperature = 0x80F5;
  stub.board ().sensor[0].humidity = 0x0292;
  open_and_sync (session);

  TEST_ASSERT_EQUAL (PIXTEND_OK, session.read_sensor (0, PIXTEND_DHT22, &r));
  TEST_ASSERT_FLOAT_WITHIN (1e-4f, -24.5f, (float) r.celsius);
  TEST_ASSERT_FLOAT_WITHIN (1e-4f, 0.658f, (float) r.humidity);

  TEST_ASSERT_EQUAL (PIXTEND_ERR_INVALID_MODE,
                     session.read_sensor (1, PIXTEND_DHT22, &r));
  TEST_ASSERT_EQUAL (PIXTEND_OK,
                     session.set_gpio_mode (1, PIXTEND_GPIO_SENSOR));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_NO_SENSOR,
                     session.read_sensor (1, PIXTEND_DHT22, &r));
}

/* -- PWM, debounce and system flags --------------------------------------- */

void
test_pwm_config_resets_values (void)
{
  StubTransport stub;
  BoardSession session (stub);
  struct pixtend_output out;

  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_pwm_value (0, 1, 500));
  TEST_ASSERT_EQUAL (PIXTEND_OK,
                     session.set_pwm_config (0, PIXTEND_PWM_DUTY_CYCLE,
                                              PIXTEND_PWM_PRESCALE_2MHZ,
                                              true, true, 1000));
  TEST_ASSERT_EQUAL (0, session.pending_output ().pwm[0].value[1]);
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_pwm_value (0, 0, 250));

  open_and_sync (session);
  last_output (stub, &out);
  TEST_ASSERT_EQUAL (PIXTEND_PWM_DUTY_CYCLE, out.pwm[0].mode);
  TEST_ASSERT_EQUAL (PIXTEND_PWM_PRESCALE_2MHZ, out.pwm[0].prescaler);
  TEST_ASSERT_TRUE (out.pwm[0].enable[0]);
  TEST_ASSERT_TRUE (out.pwm[0].enable[1]);
  TEST_ASSERT_EQUAL (1000, out.pwm[0].ctrl1);
  TEST_ASSERT_EQUAL (250, out.pwm[0].value[0]);
  TEST_ASSERT_EQUAL (0, out.pwm[0].value[1]);
}

void
test_pwm_rejects_bad_arguments (void)
{
  StubTransport stub;
  BoardSession session (stub);
  TEST_ASSERT_EQUAL (PIXTEND_ERR_INVALID_CHANNEL,
                     session.set_pwm_config (3, PIXTEND_PWM_SERVO,
                                              PIXTEND_PWM_PRESCALE_OFF,
                                              false, false, 0));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_INVALID_MODE,
                     session.set_pwm_config (0, 4, PIXTEND_PWM_PRESCALE_OFF,
                                              false, false, 0));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_OUT_OF_RANGE,
                     session.set_pwm_config (0, PIXTEND_PWM_SERVO, 6,
                                              false, false, 0));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_INVALID_CHANNEL,
                     session.set_pwm_value (0, 2, 1));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_INVALID_CHANNEL,
                     session.set_pwm_value (3, 0, 1));
}

void
test_pwm_mode_limits_prescaler_and_ctrl1 (void)
{
  StubTransport stub;
  BoardSession session (stub);
  struct pixtend_output out;

  /* Servo: fixed clock, no prescaler, no ctrl1 */
  TEST_ASSERT_EQUAL (PIXTEND_ERR_INVALID_MODE,
                     session.set_pwm_config (0, PIXTEND_PWM_SERVO,
                                             PIXTEND_PWM_PRESCALE_16MHZ,
                                             true, false, 0));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_INVALID_MODE,
                     session.set_pwm_config (0, PIXTEND_PWM_SERVO,
                                             PIXTEND_PWM_PRESCALE_OFF,
                                             true, false, 1234));
  /* Frequency: prescaler allowed, ctrl1 not */
  TEST_ASSERT_EQUAL (PIXTEND_ERR_INVALID_MODE,
                     session.set_pwm_config (1, PIXTEND_PWM_FREQUENCY,
                                             PIXTEND_PWM_PRESCALE_2MHZ,
                                             true, true, 999));
  TEST_ASSERT_EQUAL (0, session.pending_output ().pwm[0].ctrl1);
  TEST_ASSERT_EQUAL (0, session.pending_output ().pwm[1].ctrl1);

  TEST_ASSERT_EQUAL (PIXTEND_OK,
                     session.set_pwm_config (0, PIXTEND_PWM_SERVO,
                                             PIXTEND_PWM_PRESCALE_OFF,
                                             true, false, 0));
  TEST_ASSERT_EQUAL (PIXTEND_OK,
                     session.set_pwm_config (1, PIXTEND_PWM_FREQUENCY,
                                             PIXTEND_PWM_PRESCALE_2MHZ,
                                             true, true, 0));
  open_and_sync (session);
  last_output (stub, &out);
  TEST_ASSERT_EQUAL (PIXTEND_PWM_SERVO, out.pwm[0].mode);
  TEST_ASSERT_EQUAL (PIXTEND_PWM_PRESCALE_OFF, out.pwm[0].prescaler);
  TEST_ASSERT_EQUAL (0, out.pwm[0].ctrl1);
  TEST_ASSERT_TRUE (out.pwm[0].enable[0]);
  TEST_ASSERT_EQUAL (PIXTEND_PWM_FREQUENCY, out.pwm[1].mode);
  TEST_ASSERT_EQUAL (PIXTEND_PWM_PRESCALE_2MHZ, out.pwm[1].prescaler);
  TEST_ASSERT_EQUAL (0, out.pwm[1].ctrl1);
}

void
test_debounce_settings (void)
{
  StubTransport stub;
  BoardSession session (stub);
  struct pixtend_output out;

  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_di_debounce (7, 10));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_INVALID_CHANNEL,
                     session.set_di_debounce (8, 10));
  TEST_ASSERT_EQUAL (PIXTEND_OK, session.set_gpio_debounce (1, 5));
  TEST_ASSERT_EQUAL (PIXTEND_ERR_INVALID_CHANNEL,
                     session.set_gpio_debounce (2, 5));
  open_and_sync (session);
  last_output (stub, &out);
  TEST_ASSERT_EQUAL (10, out.di_debounce[7]);
  TEST_ASSERT_EQUAL (5, out.gpio_debounce[1]);
}

void
test_system_flags (void)
{
  StubTransport stub;
  BoardSession session (stub);
  struct pixtend_output out;

  session.set_led_disable (true);
  session.set_retain_copy (true);
  open_and_sync (session);
  last_output (stub, &out);
  TEST_ASSERT_EQUAL_HEX8 (PIXTEND_SYS_LED_DISABLE | PIXTEND_SYS_RETAIN_COPY,
                          out.system);

  session.set_led_disable (false);
  TEST_ASSERT_EQUAL_HEX8 (PIXTEND_SYS_RETAIN_COPY,
                          session.pending_output ().system);
}

void
test_state_names (void)
{
  TEST_ASSERT_EQUAL_STRING ("disconnected",
                            pixtend_state_name (PIXTEND_DISCONNECTED));
  TEST_ASSERT_EQUAL_STRING ("faulted", pixtend_state_name (PIXTEND_FAULTED));
}

int
main (void)
{
  UNITY_BEGIN ();

  /* Lifecycle */
  RUN_TEST (test_new_session_is_disconnected);
  RUN_TEST (test_open_failure_reported);
  RUN_TEST (test_open_moves_to_connected);
  RUN_TEST (test_getters_before_exchange_not_synchronized);
  RUN_TEST (test_exchange_synchronizes);
  RUN_TEST (test_close_stops_exchanges);
  RUN_TEST (test_destructor_releases_transport);
  RUN_TEST (test_sequence_counts_bus_exchanges);

  /* Digital I/O */
  RUN_TEST (test_digital_output_reaches_frame);
  RUN_TEST (test_outputs_latch_across_cycles);
  RUN_TEST (test_setter_invalid_channel_leaves_state);
  RUN_TEST (test_digital_input_from_snapshot);

  /* Analog I/O */
  RUN_TEST (test_analog_input_modes);
  RUN_TEST (test_analog_output_sends_dac_words);
  RUN_TEST (test_analog_output_rejects_bad_values);
  RUN_TEST (test_disable_analog_output);

  /* Safemode */
  RUN_TEST (test_safemode_rejects_unsafe_analog);
  RUN_TEST (test_safemode_enable_rejected_when_pending_unsafe);
  RUN_TEST (test_safemode_tightening_bound_rejected);
  RUN_TEST (test_safemode_relay_and_gpio);
  RUN_TEST (test_safemode_is_not_board_safe_state);

  /* Faults */
  RUN_TEST (test_three_timeouts_fault_session);
  RUN_TEST (test_reopen_after_fault);
  RUN_TEST (test_getters_work_while_faulted);
  RUN_TEST (test_checksum_error_keeps_snapshot);
  RUN_TEST (test_first_checksum_error_never_faults);
  RUN_TEST (test_transport_error_faults_at_threshold_one);
  RUN_TEST (test_repeated_checksum_errors_fault);
  RUN_TEST (test_mixed_failures_share_counter);
  RUN_TEST (test_success_resets_fault_counter);
  RUN_TEST (test_wrong_reply_length);
  RUN_TEST (test_model_mismatch);
  RUN_TEST (test_failed_dac_write_keeps_snapshot);

  /* Board state */
  RUN_TEST (test_board_error_codes);
  RUN_TEST (test_board_judges_corrupt_output_frame);
  RUN_TEST (test_safe_state_request_stops_board);
  RUN_TEST (test_watchdog_expired_flag);
  RUN_TEST (test_watchdog_period_range);
  RUN_TEST (test_board_warnings_reported);

  /* Retain */
  RUN_TEST (test_retain_round_trip);
  RUN_TEST (test_retain_requires_enable);
  RUN_TEST (test_retain_block_padding_and_limit);

  /* GPIO and sensors */
  RUN_TEST (test_gpio_modes_and_pullups);
  RUN_TEST (test_leaving_output_mode_drops_level);
  RUN_TEST (test_gpio_input_read);
  RUN_TEST (test_sensor_read);

  /* PWM, debounce, flags */
  RUN_TEST (test_pwm_config_resets_values);
  RUN_TEST (test_pwm_rejects_bad_arguments);
  RUN_TEST (test_pwm_mode_limits_prescaler_and_ctrl1);
  RUN_TEST (test_debounce_settings);
  RUN_TEST (test_system_flags);
  RUN_TEST (test_state_names);

  return UNITY_END ();
}
