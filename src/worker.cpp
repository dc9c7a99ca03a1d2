#include "worker.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <chrono>

namespace sandbox {
using namespace std;

worker_pool::worker_pool(size_t count) {
    for (size_t i = 0; i < count; ++i)
        threads.emplace_back([this, i] { worker_loop(i); });
    LOG(INFO) << "Started " << count << " workers";
}

worker_pool::~worker_pool() {
    stop();
}

void worker_pool::submit(job task) {
    jobs.push(move(task));
}

void worker_pool::stop() {
    stopping = true;
    for (auto &thd : threads)
        if (thd.joinable()) thd.join();
}

size_t worker_pool::pending() {
    return jobs.size();
}

void worker_pool::worker_loop(size_t worker_id) {
    while (true) {
        job task;
        if (!jobs.pop_for(task, chrono::milliseconds(100))) {
            if (stopping) {
                // 停止后不会再有新任务，队列为空时自然退出。
                // 可能存在极限情况：pop_for 超时后其他线程推送了新任务，
                // 此时由其他 worker 完成该任务。
                break;
            }
            continue;
        }

        try {
            task();
        } catch (std::exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " has crashed when running a job, " << ex.what() << endl
                       << boost::diagnostic_information(ex);
        }
    }
    DLOG(INFO) << "Worker " << worker_id << " stopped";
}

}  // namespace sandbox
