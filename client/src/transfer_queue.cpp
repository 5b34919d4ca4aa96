#include "transfer_queue.hpp"

#include <sstream>

#include "logger.hpp"

namespace
{
	template <class... Ts>
	struct overloaded : Ts... { using Ts::operator()...; };

	template <class... Ts>
	overloaded(Ts...) -> overloaded<Ts...>;
}

std::string QueuedJob::describe() const
{
	std::ostringstream out;
	out << "#" << id << " ";

	std::visit(overloaded{
		[&](const SingleFileJob& job) { out << "file " << job.path.string(); },
		[&](const DirectoryJob& job) { out << "directory " << job.path.string(); },
		[&](const MultiFileJob& job) { out << job.paths.size() << " files"; }
	}, target);

	out << " -> " << params.host << ":" << params.port;
	if (params.use_compression) out << " [" << algorithm_to_string(params.algorithm) << "]";
	if (params.use_encryption) out << " [encrypted]";
	if (params.resume_enabled) out << " [resume]";

	return out.str();
}

TransferQueue::TransferQueue(const ClientConfig& config)
	: config(config)
{
	runner = [this](const QueuedJob& job) { return run_job(job); };
}

TransferQueue::TransferQueue(const ClientConfig& config, JobRunner runner)
	: config(config), runner(std::move(runner))
{
}

TransferQueue::~TransferQueue()
{
	cancel_requested = true;
	running = false;

	std::lock_guard<std::mutex> start_lock(start_mutex);
	if (worker.joinable()) {
		worker.join();
	}
}

SendResult TransferQueue::run_job(const QueuedJob& job)
{
	Client client(job.params, config);
	client.set_console_progress(true);

	return std::visit(overloaded{
		[&](const SingleFileJob& target) { return client.send_file(target.path); },
		[&](const DirectoryJob& target) { return client.send_directory(target.path); },
		[&](const MultiFileJob& target) { return client.send_multiple_files(target.paths); }
	}, job.target);
}

uint64_t TransferQueue::enqueue(QueuedJob job)
{
	std::lock_guard<std::mutex> lock(mutex);

	job.id = next_id++;
	jobs.push_back(std::move(job));
	return jobs.back().id;
}

void TransferQueue::start()
{
	// one caller at a time may join and replace the worker
	std::lock_guard<std::mutex> start_lock(start_mutex);

	std::unique_lock<std::mutex> lock(mutex);
	if (running) return;

	// a finished or stopped worker may still be running its handlers
	if (worker.joinable()) {
		lock.unlock();
		worker.join();
		lock.lock();
	}

	cancel_requested = false;
	running = true;
	worker_active = true;

	Logger::get().log_event(Logger::LogEvent::QUEUE_START, {
		{"pending", static_cast<int64_t>(jobs.size())}
	});

	worker = std::thread(&TransferQueue::worker_loop, this);
}

void TransferQueue::stop()
{
	cancel_requested = true;
	running = false;

	Logger::get().log_event(Logger::LogEvent::QUEUE_STOP, {
		{"pending", static_cast<int64_t>(count())}
	});
}

void TransferQueue::clear()
{
	std::lock_guard<std::mutex> lock(mutex);
	jobs.clear();
}

size_t TransferQueue::count() const
{
	std::lock_guard<std::mutex> lock(mutex);
	return jobs.size();
}

std::vector<std::string> TransferQueue::pending() const
{
	std::lock_guard<std::mutex> lock(mutex);

	std::vector<std::string> out;
	out.reserve(jobs.size());
	for (const auto& job : jobs) {
		out.push_back(job.describe());
	}
	return out;
}

void TransferQueue::on_transfer_completed(CompletedHandler handler)
{
	std::lock_guard<std::mutex> lock(mutex);
	completed_handlers.push_back(std::move(handler));
}

void TransferQueue::on_all_completed(DrainedHandler handler)
{
	std::lock_guard<std::mutex> lock(mutex);
	drained_handlers.push_back(std::move(handler));
}

void TransferQueue::wait_idle()
{
	std::unique_lock<std::mutex> lock(mutex);
	idle_cv.wait(lock, [this] { return !worker_active; });
}

void TransferQueue::fire_completed(const QueuedJob& job, bool success, const std::string& error)
{
	std::vector<CompletedHandler> snapshot;
	{
		std::lock_guard<std::mutex> lock(mutex);
		snapshot = completed_handlers;
	}

	for (auto& handler : snapshot) {
		handler(job, success, error);
	}
}

void TransferQueue::fire_drained()
{
	std::vector<DrainedHandler> snapshot;
	{
		std::lock_guard<std::mutex> lock(mutex);
		snapshot = drained_handlers;
	}

	for (auto& handler : snapshot) {
		handler();
	}
}

void TransferQueue::worker_loop()
{
	bool drained = false;

	while (true) {
		// checked before dequeuing so a stop never drops a job
		if (cancel_requested) break;

		QueuedJob job;
		{
			std::lock_guard<std::mutex> lock(mutex);
			if (jobs.empty()) {
				// under the lock so a job enqueued from here on sees the queue idle
				running = false;
				drained = true;
				break;
			}

			job = std::move(jobs.front());
			jobs.pop_front();
		}

		bool success = false;
		std::string error;

		try {
			SendResult result = runner(job);
			if (result.interrupted) {
				error = "Transfer interrupted, resume available: " + result.error;
			}
			else {
				success = true;
			}
		}
		catch (const std::exception& e) {
			error = e.what();
		}

		if (success) {
			Logger::get().log_event(Logger::LogEvent::QUEUE_JOB_COMPLETE, {
				{"job", static_cast<uint64_t>(job.id)}
			});
		}
		else {
			Logger::get().log_event(Logger::LogEvent::QUEUE_JOB_FAILURE, {
				{"job", static_cast<uint64_t>(job.id)},
				{"error", error}
			});
		}

		fire_completed(job, success, error);
	}

	running = false;

	if (drained) {
		Logger::get().log_event(Logger::LogEvent::QUEUE_DRAINED);
		fire_drained();
	}

	{
		std::lock_guard<std::mutex> lock(mutex);
		worker_active = false;
	}
	idle_cv.notify_all();
}
