#include <atomic>
#include <csignal>
#include <iostream>
#include <boost/program_options.hpp>
#include <fmt/format.h>

#include "sardauscan/app_config.hpp"
#include "sardauscan/pipeline/processing_pipeline.hpp"
#include "sardauscan/task/file_task.hpp"
#include "sardauscan/task/task_factory.hpp"
#include "sardauscan/utils/logging.hpp"

namespace po = boost::program_options;
using namespace sardauscan;

namespace {

std::atomic<BackgroundWorker*> running_worker{nullptr};

void signal_handler(int signal) {
    if (signal == SIGINT) {
        BackgroundWorker* worker = running_worker.load();
        if (worker != nullptr) {
            worker->cancel_async();
        }
    }
}

void list_tasks(const TaskFactory& factory) {
    for (const auto& task : factory.palette()) {
        fmt::print("{:<12} {:<10} -> {:<10} {:<12} {}\n",
                   to_string(task->task_type()),
                   to_string(task->in()),
                   to_string(task->out()),
                   task->type_name(),
                   task->tooltip());
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,h", "produce help message")
        ("config,c", po::value<std::string>(), "JSON configuration file")
        ("pipeline,p", po::value<std::string>(), "JSON pipeline description")
        ("settings-dir,s", po::value<std::string>(), "directory holding the <Task>.config.xml files")
        ("non-interactive,n", "never prompt for a file name")
        ("save-settings", "store the settings of every pipeline task after the run")
        ("list-tasks,l", "list the available tasks");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (po::error& e) {
        SDS_ERROR("{}", e.what());
        std::cerr << desc;
        return 2;
    }

    if (vm.count("help")) {
        std::cout << desc;
        return 0;
    }

    TaskFactory factory;
    if (vm.count("list-tasks")) {
        list_tasks(factory);
        return 0;
    }

    AppConfig config;
    ProcessingPipeline pipeline;
    try {
        if (vm.count("config")) {
            config = AppConfig::load_from_file(vm["config"].as<std::string>());
        }
        if (vm.count("pipeline")) {
            config.pipeline_file = vm["pipeline"].as<std::string>();
        }
        if (vm.count("settings-dir")) {
            config.settings_directory = vm["settings-dir"].as<std::string>();
        }
        if (vm.count("non-interactive")) {
            config.interactive = false;
        }
        if (config.pipeline_file.empty()) {
            SDS_ERROR("No pipeline given, use --pipeline or the pipeline_file configuration key");
            return 2;
        }

        pipeline = ProcessingPipeline::load_from_file(config.pipeline_file, factory);
    } catch (std::runtime_error& e) {
        SDS_ERROR("{}", e.what());
        return 2;
    }

    const size_t loaded = pipeline.load_task_settings(config.settings_directory);
    SDS_INFO("Pipeline with {} tasks, {} settings files loaded from {}", pipeline.size(), loaded, config.settings_directory);
    for (const auto& task : pipeline.get_tasks()) {
        if (auto* file_task = dynamic_cast<FileTask*>(task.get())) {
            file_task->set_initial_directory(config.user_data_path);
        }
    }

    ConsoleFileDialog dialog;
    FileDialog* control = config.interactive ? &dialog : nullptr;

    BackgroundWorker worker;
    running_worker = &worker;
    std::signal(SIGINT, signal_handler);

    auto progress = [](const ProcessingTask& sender, int percent, const ScanDataPtr&) {
        SDS_INFO("{}: {}%", sender.display_name(), percent);
    };

    worker.run_worker_async([&pipeline, control, progress](BackgroundWorker& self, WorkerArgs& args) {
        pipeline.run(nullptr, control, &self, &args, progress);
    });

    WorkerArgs result;
    try {
        result = worker.wait();
    } catch (std::exception& e) {
        SDS_ERROR("Pipeline stopped: {}", e.what());
        running_worker = nullptr;
        return 1;
    }
    running_worker = nullptr;

    if (result.cancel) {
        SDS_WARN("Pipeline cancelled");
        return 1;
    }
    for (const auto& task : pipeline.get_tasks()) {
        if (task->get_status() != TaskStatus::Finished) {
            SDS_ERROR("{}", task->tooltip());
            return 1;
        }
    }

    if (vm.count("save-settings")) {
        try {
            pipeline.save_task_settings(config.settings_directory);
        } catch (std::exception& e) {
            SDS_ERROR("Cannot save task settings: {}", e.what());
            return 1;
        }
    }
    return 0;
}
