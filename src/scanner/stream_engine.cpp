#include "record_stream/stream_engine.hpp"
#include "record_stream/order_line.hpp"
#include "record_stream/person.hpp"

namespace rs {

const char* outcome_name(RunOutcome o) noexcept {
  switch (o) {
    case RunOutcome::Completed: return "completed";
    case RunOutcome::Cancelled: return "cancelled";
    case RunOutcome::NotFound:  return "not_found";
    case RunOutcome::IoFailed:  return "io_failed";
  }
  return "unknown";
}

template class StreamEngine<PersonParser>;
template class StreamEngine<OrderLineParser>;

}
