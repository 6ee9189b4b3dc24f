/**
 * @file main.cpp
 * @brief Entry point for the clipforge command-line tool
 *
 * @details Main entry point that handles:
 *
 *          - process: submit a URL or local file, run it in-process and
 *            print status updates until the job is terminal
 *
 *          - status / result: print the projections of a stored job
 *
 *          - reap: one expiry sweep over the store
 *
 * @note All settings come from the environment; see config/clipforge.env.
 */

#include <chrono>
#include <cstdio>
#include <string>
#include <thread>

#include <fmt/core.h>

#include "clipforge/captions.hpp"
#include "clipforge/logging.hpp"
#include "clipforge/projection.hpp"
#include "clipforge/service.hpp"

using namespace clipforge;

namespace {

void print_usage() {
  std::string styles;
  for (const auto &name : caption_style_names())
    styles += (styles.empty() ? "" : "|") + name;

  LOG_WARN("Usage:");
  LOG_WARN("  clipforge process <url|file> [--captions on|off] "
           "[--caption-style {}]",
           styles);
  LOG_WARN("                    [--caption-color #RGB] [--outline-color #RGB] "
           "[--api-key KEY]");
  LOG_WARN("  clipforge status <job_id>");
  LOG_WARN("  clipforge result <job_id>");
  LOG_WARN("  clipforge reap");
}

int print_query(const QueryOutcome &out) {
  if (!out.ok()) {
    LOG_ERROR("{}: {}", to_string(out.error), out.message);
    return out.error == ErrorKind::NotFound ? 2 : 3;
  }
  fmt::print("{}\n", out.body.dump(2));
  return 0;
}

/// Parses process options; false on an unknown flag or missing value
bool parse_process_args(int argc, char *argv[], SubmitRequest &req) {
  const std::string source = argv[2];
  if (source.rfind("http://", 0) == 0 || source.rfind("https://", 0) == 0)
    req.source_url = source;
  else
    req.upload_path = source;

  for (int i = 3; i < argc; ++i) {
    const std::string flag = argv[i];
    if (i + 1 >= argc) {
      LOG_ERROR("Missing value for {}", flag);
      return false;
    }
    const std::string value = argv[++i];

    if (flag == "--captions") {
      req.include_captions = value != "off";
    } else if (flag == "--caption-style") {
      req.caption_style = value;
    } else if (flag == "--caption-color") {
      req.caption_color = value;
    } else if (flag == "--outline-color") {
      req.outline_color = value;
    } else if (flag == "--api-key") {
      req.api_key = value;
    } else {
      LOG_ERROR("Unknown option {}", flag);
      return false;
    }
  }
  return true;
}

int run_process(ClipService &service, const SubmitRequest &req) {
  if (!service.start())
    return 3;

  SubmitOutcome submitted = service.submit(req);
  if (!submitted.ok()) {
    LOG_ERROR("{}: {}", to_string(submitted.error), submitted.message);
    service.stop();
    return submitted.error == ErrorKind::Validation ? 1 : 3;
  }
  LOG_INFO("Job {} {}", submitted.job_id, to_string(submitted.status));

  /// Poll like a client would
  std::string last_shown;
  int exit_code = 3;
  for (;;) {
    QueryOutcome st = service.status(submitted.job_id);
    if (!st.ok()) {
      LOG_ERROR("{}: {}", to_string(st.error), st.message);
      break;
    }

    const auto &logs = st.body["logs"];
    for (std::size_t i = first_unseen_log(logs, last_shown); i < logs.size();
         ++i) {
      last_shown = logs[i].get<std::string>();
      LOG_INFO("  {}", last_shown);
    }

    const std::string status = st.body["status"].get<std::string>();
    if (status == "completed" || status == "failed") {
      exit_code = print_query(service.result(submitted.job_id));
      if (status == "failed")
        exit_code = 4;
      break;
    }
    std::this_thread::sleep_for(std::chrono::seconds(1));
  }

  service.stop();
  return exit_code;
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string command = argv[1];
  ClipService service(ServiceSettings::from_env());

  if (command == "process" && argc >= 3) {
    SubmitRequest req;
    if (!parse_process_args(argc, argv, req)) {
      print_usage();
      return 1;
    }
    return run_process(service, req);
  }

  if (command == "status" && argc == 3)
    return print_query(service.status(argv[2]));

  if (command == "result" && argc == 3)
    return print_query(service.result(argv[2]));

  if (command == "reap" && argc == 2) {
    int purged = service.reap();
    if (purged < 0) {
      LOG_ERROR("Job store unavailable");
      return 3;
    }
    LOG_SUCCESS("Purged {} expired job(s)", purged);
    return 0;
  }

  print_usage();
  return 1;
}
