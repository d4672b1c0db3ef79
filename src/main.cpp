#include <glog/logging.h>
#include <sys/stat.h>
#include <unistd.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <csignal>
#include <iostream>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "judge/toolchain.hpp"
#include "monitor/monitor.hpp"
#include "scheduler.hpp"
#include "store/result_store.hpp"
using namespace std;

static volatile sig_atomic_t stop = 0;

void sigintHandler(int /* signum */) {
    stop = 1;
}

/**
 * @brief 读取提交文件，文件内容可以是单个提交或者提交数组
 */
static vector<shared_ptr<const grader::submission>> load_submissions(const filesystem::path &path) {
    nlohmann::json j = nlohmann::json::parse(grader::read_file_content(path));
    vector<shared_ptr<const grader::submission>> result;
    if (j.is_array()) {
        for (auto &item : j) result.push_back(make_shared<const grader::submission>(item.get<grader::submission>()));
    } else {
        result.push_back(make_shared<const grader::submission>(j.get<grader::submission>()));
    }
    return result;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    filesystem::path current(argv[0]);
    filesystem::path repo_dir(filesystem::weakly_canonical(current).parent_path().parent_path());

    signal(SIGINT, sigintHandler);
    signal(SIGTERM, sigintHandler);

    namespace po = boost::program_options;
    po::options_description desc("grader options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "set the engine configuration file. You can either pass it from environ CONFIG")
        ("toolchains", po::value<string>(), "set the toolchain table file. You can either pass it from environ TOOLCHAINS, default to config/toolchains.json")
        ("run-dir", po::value<string>(), "set the directory to compile and run submissions. You can either pass it from environ RUNDIR")
        ("result-dir", po::value<string>(), "set the directory to store results when the file result store is used. You can either pass it from environ RESULTDIR")
        ("concurrency", po::value<size_t>(), "set the number of submissions judged concurrently. You can either pass it from environ CONCURRENCY")
        ("tie-break", po::value<string>(), "set how the deciding test is picked among failures of the same kind, first or severity")
        ("priority", po::value<int>()->default_value(0), "set the priority of the submissions given in command line")
        ("cgroup", "account memory and cpu time of submissions with cgroups, requires root privilege")
        ("debug", "turn on the debug mode to keep the submission directories to check the validity of result files.")
        ("submission", po::value<vector<string>>(), "submission files to judge")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("submission", -1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "grader: Compile and run submissions against their test cases, record the verdicts" << endl
             << "Usage: " << argv[0] << " [options] submission.json..." << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "grader 1.0" << endl;
        return EXIT_SUCCESS;
    }

    grader::engine_config config;
    try {
        if (vm.count("config")) {
            config = grader::load_engine_config(vm.at("config").as<string>());
        } else if (getenv("CONFIG")) {
            config = grader::load_engine_config(getenv("CONFIG"));
        }

        if (vm.count("concurrency")) {
            config.concurrency = vm.at("concurrency").as<size_t>();
        } else if (getenv("CONCURRENCY")) {
            config.concurrency = boost::lexical_cast<size_t>(getenv("CONCURRENCY"));
        }

        if (vm.count("tie-break"))
            config.tie_break = grader::parse_tie_break_policy(vm.at("tie-break").as<string>());
    } catch (grader::config_error &e) {
        LOG(ERROR) << e.what();
        return EXIT_FAILURE;
    } catch (boost::bad_lexical_cast &e) {
        LOG(ERROR) << "CONCURRENCY environment variable is not a number";
        return EXIT_FAILURE;
    }
    CHECK(config.concurrency > 0) << "Concurrency should be positive";

    if (vm.count("debug") || getenv("DEBUG")) config.debug = true;
    grader::DEBUG = config.debug;

    if (vm.count("cgroup")) config.use_cgroup = true;
    if (config.use_cgroup && getuid() != 0) {
        cerr << "You should run this program in privileged mode to use cgroups" << endl;
        if (!grader::DEBUG) return EXIT_FAILURE;
    }

    if (vm.count("run-dir")) {
        config.run_dir = filesystem::path(vm.at("run-dir").as<string>());
    } else if (getenv("RUNDIR")) {
        config.run_dir = filesystem::path(getenv("RUNDIR"));
    }
    grader::RUN_DIR = config.run_dir;
    error_code ec;
    filesystem::create_directories(grader::RUN_DIR, ec);
    CHECK(filesystem::is_directory(grader::RUN_DIR))
        << "Run directory " << grader::RUN_DIR << " does not exist";

    if (vm.count("result-dir")) {
        config.store.directory = filesystem::path(vm.at("result-dir").as<string>());
    } else if (getenv("RESULTDIR")) {
        config.store.directory = filesystem::path(getenv("RESULTDIR"));
    }

    filesystem::path toolchains_path = repo_dir / "config" / "toolchains.json";
    if (vm.count("toolchains")) {
        toolchains_path = vm.at("toolchains").as<string>();
    } else if (getenv("TOOLCHAINS")) {
        toolchains_path = getenv("TOOLCHAINS");
    }
    CHECK(filesystem::is_regular_file(toolchains_path))
        << "Toolchain table " << toolchains_path << " does not exist";

    // 让评测系统写入的数据只允许当前用户写入
    umask(0022);

    grader::toolchain_registry registry;
    unique_ptr<grader::store::result_store> store;
    try {
        registry = grader::toolchain_registry::load(toolchains_path);
        store = grader::store::make_result_store(config.store);
    } catch (grader::grader_exception &e) {
        LOG(ERROR) << e.what();
        return EXIT_FAILURE;
    }

    vector<shared_ptr<const grader::submission>> submissions;
    if (vm.count("submission")) {
        for (auto &file : vm.at("submission").as<vector<string>>()) {
            try {
                auto loaded = load_submissions(file);
                submissions.insert(submissions.end(), loaded.begin(), loaded.end());
            } catch (std::exception &e) {
                LOG(ERROR) << "Submission file " << file << " is malformed: " << e.what();
                return EXIT_FAILURE;
            }
        }
    }

    grader::runner_options options;
    options.poll_interval = config.poll_interval;
    options.kill_grace = config.kill_grace;
    options.use_cgroup = config.use_cgroup;
    grader::process_runner runner(options);

    vector<shared_ptr<grader::monitor>> monitors = {make_shared<grader::logging_monitor>()};
    grader::scheduler sched(config, registry, runner, *store, monitors);

    int priority = vm.at("priority").as<int>();
    vector<grader::ticket> tickets;
    bool rejected = false;
    for (auto &submit : submissions) {
        try {
            tickets.push_back(sched.submit(submit, priority));
        } catch (grader::overloaded_error &e) {
            LOG(WARNING) << *submit << " rejected: " << e.what();
            rejected = true;
        } catch (std::invalid_argument &e) {
            LOG(WARNING) << *submit << " rejected: " << e.what();
            rejected = true;
        }
    }

    for (auto &t : tickets) {
        while (!t.wait_for(chrono::milliseconds(100))) {
            if (stop) {
                LOG(ERROR) << "Received SIGINT, stopping workers";
                sched.shutdown(false);
            }
        }
    }
    sched.shutdown(true);

    bool all_persisted = true;
    for (auto &t : tickets) {
        const grader::submission_result &result = t.get();
        nlohmann::json j = result;
        cout << j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << endl;
        all_persisted = all_persisted && result.persisted;
    }

    return rejected || !all_persisted ? EXIT_FAILURE : EXIT_SUCCESS;
}
