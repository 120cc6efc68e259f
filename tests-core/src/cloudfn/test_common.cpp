/*
 * Copyright (c) 2014-2015, Hewlett-Packard Development Company, LP.
 * This program is free software; you can redistribute it and/or modify it
 * under the terms of the GNU General Public License as published by the Free
 * Software Foundation; either version 2 of the License, or (at your option)
 * any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT
 * ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 * FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for
 * more details. You should have received a copy of the GNU General Public
 * License along with this program; if not, write to the Free Software
 * Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA 02111-1307 USA
 *
 * HP designates this particular file as subject to the "Classpath" exception
 * as provided by HP in the LICENSE.txt file that accompanied this code.
 */
#include "cloudfn/test_common.hpp"

#include <signal.h>
#include <tinyxml2.h>
#include <unistd.h>

#include <chrono>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include "cloudfn/assert_nd.hpp"
#include "cloudfn/cloudfn_options.hpp"
#include "cloudfn/assorted/assorted_func.hpp"
#include "cloudfn/fs/filesystem.hpp"
#include "cloudfn/fs/path.hpp"

namespace cloudfn {
  std::string get_random_name() {
    // to further randomize the name, we use hash of executable's path and its parameter.
    // we run many concurrent testcases, but all of them have different executable or parameters.
    std::string seed;
    std::ifstream in;
    in.open("/proc/self/cmdline", std::ios_base::in);
    if (!in.is_open()) {
      // there are cases where /proc/self/cmdline doesn't work. in that case just executable path
      seed = assorted::get_current_executable_path();
    } else {
      std::getline(in, seed);
      in.close();
    }

    std::hash<std::string> h1;
    uint64_t differentiator = h1(seed);
    return fs::unique_name("%%%%_%%%%_%%%%_%%%%", differentiator);
  }

  std::string get_random_tmp_file_path(const std::string& name) {
    std::string path = std::string("tmp_cloudfn/") + get_random_name() + "/";
    fs::create_directories(fs::Path(path));
    return path + name;
  }

  CloudfnOptions get_randomized_paths() {
    CloudfnOptions options;
    std::string uniquefier = get_random_name();
    std::cout << "test uniquefier=" << uniquefier << std::endl;
    fs::Path base("tmp_cloudfn");
    base /= uniquefier;
    {
      fs::Path projects(base);
      projects /= "projects";
      options.master_.projects_dir_ = projects.string();
    }
    {
      fs::Path tasks(base);
      tasks /= "tasks";
      options.task_.task_dir_ = tasks.string();
    }
    {
      std::stringstream str;
      str << base.string() << "/envs/$PROJECT$";
      options.worker_.environments_dir_pattern_ = str.str();
    }
    return options;
  }

  CloudfnOptions get_tiny_options() {
    CloudfnOptions options = get_randomized_paths();
    options.debugging_.debug_log_min_threshold_ = debugging::DebuggingOptions::kDebugLogInfo;
    options.debugging_.debug_log_stderr_threshold_
      = debugging::DebuggingOptions::kDebugLogInfo;
    options.debugging_.verbose_log_level_ = 1;
    options.debugging_.verbose_modules_ = "*";

    options.registry_.channel_capacity_ = 1 << 16;
    options.registry_.task_channel_capacity_ = 1 << 12;
    options.registry_.terminate_wait_ms_ = 2000;
    options.registry_.kill_wait_ms_ = 1000;

    options.master_.api_ready_timeout_ms_ = 2000;
    options.master_.worker_ready_timeout_ms_ = 10000;
    options.master_.liveness_check_interval_ms_ = 20;

    options.worker_.handler_pool_size_ = 2;
    options.worker_.runtime_command_ = "cat";
    options.worker_.ensure_environment_command_ = "";
    options.worker_.install_command_ = "";

    options.task_.execution_threads_ = 2;
    options.task_.cleanup_interval_ms_ = 0;
    options.task_.scheduler_interval_ms_ = 50;
    return options;
  }

  void write_function_file(
    const CloudfnOptions& options,
    const std::string& project,
    const std::string& function,
    const std::string& source) {
    fs::Path folder(options.master_.projects_dir_);
    folder /= project;
    fs::create_directories(folder);
    fs::Path file(folder);
    file /= function + options.worker_.function_file_suffix_;
    bool written = fs::durable_write_file(file, source);
    ASSERT_ND(written);
    UNUSED_ND(written);
  }

  void sleep_ms(uint64_t ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
  }

  void cleanup_test(const CloudfnOptions& options) {
    fs::Path projects(options.master_.projects_dir_);
    fs::remove_all(projects.parent_path());
  }

  std::string to_signal_name(int sig) {
    switch (sig) {
    case SIGHUP    : return "Hangup (POSIX).";
    case SIGINT    : return "Interrupt (ANSI).";
    case SIGQUIT   : return "Quit (POSIX).";
    case SIGILL    : return "Illegal instruction (ANSI).";
    case SIGTRAP   : return "Trace trap (POSIX).";
    case SIGABRT   : return "Abort (ANSI).";
    case SIGBUS    : return "BUS error (4.2 BSD).";
    case SIGFPE    : return "Floating-point exception (ANSI).";
    case SIGKILL   : return "Kill, unblockable (POSIX).";
    case SIGUSR1   : return "User-defined signal 1 (POSIX).";
    case SIGSEGV   : return "Segmentation violation (ANSI).";
    case SIGUSR2   : return "User-defined signal 2 (POSIX).";
    case SIGPIPE   : return "Broken pipe (POSIX).";
    case SIGALRM   : return "Alarm clock (POSIX).";
    case SIGTERM   : return "Termination (ANSI).";
    case SIGCHLD   : return "Child status has changed (POSIX).";
    case SIGCONT   : return "Continue (POSIX).";
    case SIGSTOP   : return "Stop, unblockable (POSIX).";
    default:
      return "UNKNOWN";
    }
  }
  std::string gtest_xml_path;
  std::string gtest_individual_test;
  std::string gtest_test_case_name;
  std::string gtest_package_name;
  std::string generate_failure_xml(const std::string& type, const std::string& details) {
    // The XML must be in JUnit format
    tinyxml2::XMLDocument doc;
    tinyxml2::XMLElement* root = doc.NewElement("testsuites");
    root->SetAttribute("name", "AllTests");
    root->SetAttribute("tests", 1);
    root->SetAttribute("failures", 1);
    root->SetAttribute("errors", 0);
    root->SetAttribute("time", 0);
    doc.InsertFirstChild(root);

    tinyxml2::XMLElement* suite = doc.NewElement("testsuite");
    suite->SetAttribute("name", (gtest_package_name + "." + gtest_test_case_name).c_str());
    suite->SetAttribute("tests", 1);
    suite->SetAttribute("failures", 1);
    suite->SetAttribute("errors", 0);
    suite->SetAttribute("disabled", 0);
    suite->SetAttribute("time", 0);
    root->InsertFirstChild(suite);

    tinyxml2::XMLElement* testcase = doc.NewElement("testcase");
    testcase->SetAttribute("name", gtest_individual_test.c_str());
    testcase->SetAttribute("status", "run");
    testcase->SetAttribute("classname", (gtest_package_name + "." + gtest_test_case_name).c_str());
    testcase->SetAttribute("time", 0);
    suite->InsertFirstChild(testcase);

    tinyxml2::XMLElement* test = doc.NewElement("failure");
    test->SetAttribute("type", type.c_str());
    test->SetAttribute("message", details.c_str());
    testcase->InsertFirstChild(test);

    tinyxml2::XMLPrinter printer;
    doc.Print(&printer);
    return printer.CStr();
  }
  std::string generate_failure_xml(int sig, const std::string& details) {
    return generate_failure_xml(to_signal_name(sig), details);
  }
  static void handle_signals(int sig, siginfo_t* si, void* /*unused*/) {
    std::stringstream str;
    str << "================================================================" << std::endl;
    str << "====   SIGNAL Received While Running Testcase" << std::endl;
    str << "====   SIGNAL Code=" << sig << "("<< to_signal_name(sig) << ")" << std::endl;
    str << "====   At address=" << si->si_addr << std::endl;
    str << "================================================================" << std::endl;
    str << get_recent_assert_backtrace() << std::endl;
    str << "=== Stack frame" << std::endl << print_backtrace() << std::endl;

    std::string details = str.str();
    std::cerr << details;

    if (gtest_xml_path.size() == 0) {
      std::cerr << "XML Output file was not specified, so we exit as a usual crash" << std::endl;
      ::exit(1);
    } else {
      std::cerr << "Converting the signal to a testcase failure in " << gtest_xml_path << std::endl;
      // We report this error in the result XML.
      std::string xml = generate_failure_xml(sig, details);
      std::cerr << "Xml content: " << std::endl << xml << std::endl;

      std::ofstream out;
      out.open(gtest_xml_path, std::ios_base::out | std::ios_base::trunc);
      if (!out.is_open()) {
        std::cerr << "Couldn't open xml file. os_error= " << assorted::os_error() << std::endl;
        ::exit(1);
      }
      out << xml;
      out.flush();
      out.close();
      std::cerr << "Wrote out result xml file. Now exitting.." << std::endl;
      ::exit(1);
    }
  }
  void register_signal_handlers(
    const char* test_case_name,
    const char* package_name,
    int argc,
    char** argv) {
    std::cout << "****************************************************************" << std::endl;
    std::cout << "*****  Started cloudfn Unit Testcase " << std::endl;
    std::cout << "*****  Testcase name: " << test_case_name << std::endl;
    std::cout << "*****  Test Package name: " << package_name << std::endl;
    std::cout << "*****  Arguments (argc=" << argc << "): " << std::endl;

    gtest_test_case_name = test_case_name;
    gtest_package_name = package_name;
    gtest_xml_path = "";
    gtest_individual_test = "";
    for (int i = 0; i < argc; ++i) {
      std::cout << "*****    argv[" << i << "]: " << argv[i] << std::endl;
      std::string str(argv[i]);
      if (str.find("--gtest_output=xml:") == 0) {
        gtest_xml_path = str.substr(std::string("--gtest_output=xml:").size());
      } else if (str.find("--gtest_filter=*.") == 0) {
        gtest_individual_test = str.substr(std::string("--gtest_filter=*.").size());
      }
    }
    if (gtest_xml_path.size() > 0) {
      std::cout << "*****  XML Output: " << gtest_xml_path << std::endl;
    } else {
      std::cout << "*****  XML Output file was not specified. Executed manually?" << std::endl;
    }
    std::cout << "****************************************************************" << std::endl;

    struct sigaction sa;
    sa.sa_flags = SA_SIGINFO;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_sigaction = handle_signals;

    // we do not capture all signals. Only the followings are considered as 'expected'
    // testcase failures.
    ::sigaction(SIGABRT, &sa, nullptr);
    ::sigaction(SIGBUS, &sa, nullptr);
    ::sigaction(SIGFPE, &sa, nullptr);
    ::sigaction(SIGSEGV, &sa, nullptr);
    // SIGKILL/SIGSTOP cannot be captured. As a compromise, we pre-populate result xml.
  }

  void pre_populate_error_result_xml() {
    if (gtest_xml_path.size() > 0) {
      std::string xml = generate_failure_xml(
        std::string("Pre-populated Error. Test timeout happned?"),
        std::string("This is an initially written gtest xml before test execution."
        " If you are receiving this result, most likely the process has disappeared without trace."
        " This can happen when ctest kills the process via SIGSTOP, or someone killed the process"
        " via SIGKILL, etc."));

      std::ofstream out;
      out.open(gtest_xml_path, std::ios_base::out | std::ios_base::trunc);
      if (out.is_open()) {
        out << xml;
        out.flush();
        out.close();
      }
    }
  }
}  // namespace cloudfn
