#include <grpcpp/grpcpp.h>

#include <google/protobuf/empty.pb.h>
#include <google/protobuf/util/time_util.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "caretask/v1.hpp"

using namespace caretask::v1;
using google::protobuf::util::TimeUtil;

static void Usage() {
  std::cout << "Usage:\n"
            << "  caretaskctl <addr> create <note_id> <patient_id> <extracted.json>\n"
            << "  caretaskctl <addr> steps <note_id>\n"
            << "  caretaskctl <addr> due <note_id> <patient_id>\n"
            << "  caretaskctl <addr> complete <note_id> <patient_id> <step_id>\n"
            << "  caretaskctl <addr> cancel <note_id>\n"
            << "  caretaskctl <addr> states <note_id>\n"
            << "  caretaskctl <addr> hydrate\n";
}

static bool ReadFile(const std::string& path, std::string* out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream buffer;
  buffer << in.rdbuf();
  *out = buffer.str();
  return true;
}

static const char* TypeName(StepType type) {
  switch (type) {
    case STEP_TYPE_CHECKLIST:
      return "checklist";
    case STEP_TYPE_PLAN:
      return "plan";
    default:
      return "unspecified";
  }
}

static const char* StatusName(StepStatus status) {
  switch (status) {
    case STEP_STATUS_PENDING:
      return "pending";
    case STEP_STATUS_SCHEDULED:
      return "scheduled";
    case STEP_STATUS_COMPLETED:
      return "completed";
    default:
      return "unspecified";
  }
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = CareTaskService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "create") {
    if (argc < 6) {
      Usage();
      return 1;
    }

    CreateActionableStepsFromExtractionRequest req;
    req.set_note_id(argv[3]);
    req.set_patient_id(argv[4]);
    if (!ReadFile(argv[5], req.mutable_extracted_json())) {
      std::cerr << "cannot read " << argv[5] << "\n";
      return 1;
    }

    CreateActionableStepsResponse resp;
    auto status = stub->CreateActionableStepsFromExtraction(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& id : resp.step_ids()) {
      std::cout << id << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "steps") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    GetActionableStepsRequest req;
    req.set_note_id(argv[3]);

    GetActionableStepsResponse resp;
    auto status = stub->GetActionableSteps(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& step : resp.steps()) {
      std::cout << step.id() << " type=" << TypeName(step.type()) << " status=" << StatusName(step.status())
                << " due=" << TimeUtil::ToString(step.due_date()) << " description=\"" << step.description() << "\"\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "due") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    GetDueNotificationsRequest req;
    req.set_note_id(argv[3]);
    req.set_patient_id(argv[4]);

    GetDueNotificationsResponse resp;
    auto status = stub->GetDueNotifications(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (resp.notifications().empty()) {
      std::cout << "nothing due\n";
      return 0;
    }
    for (const auto& n : resp.notifications()) {
      std::cout << "due at=" << TimeUtil::ToString(n.next_occurrence()) << " description=\"" << n.description() << "\"\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "complete") {
    if (argc < 6) {
      Usage();
      return 1;
    }

    MarkCompletedRequest req;
    req.set_note_id(argv[3]);
    req.set_patient_id(argv[4]);
    req.set_step_id(argv[5]);

    google::protobuf::Empty resp;
    auto status = stub->MarkCompleted(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "completed\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    CancelNoteSchedulesRequest req;
    req.set_note_id(argv[3]);

    google::protobuf::Empty resp;
    auto status = stub->CancelNoteSchedules(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "cancelled\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "states") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    ListScheduleStatesRequest req;
    req.set_note_id(argv[3]);

    ListScheduleStatesResponse resp;
    auto status = stub->ListScheduleStates(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& state : resp.states()) {
      std::cout << state.step_id() << " active=" << (state.is_active() ? "true" : "false") << " progress="
                << state.completed_occurrences() << "/" << state.total_occurrences() << " last_completion="
                << (state.has_last_completion() ? TimeUtil::ToString(state.last_completion()) : "never") << " next="
                << (state.has_next_occurrence() ? TimeUtil::ToString(state.next_occurrence()) : "none") << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "hydrate") {
    google::protobuf::Empty req;
    HydrateDueCacheResponse resp;
    auto status = stub->HydrateDueCache(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "entries_written=" << resp.entries_written() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
