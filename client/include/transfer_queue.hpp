#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "client.hpp"
#include "config.hpp"
#include "transfer_types.hpp"

#pragma once

struct SingleFileJob {
	std::filesystem::path path;
};

struct DirectoryJob {
	std::filesystem::path path;
};

struct MultiFileJob {
	std::vector<std::filesystem::path> paths;
};

using JobTarget = std::variant<SingleFileJob, DirectoryJob, MultiFileJob>;

struct QueuedJob {
	JobTarget target;
	TransferParameters params;

	// assigned by enqueue()
	uint64_t id = 0;

	std::string describe() const;
};

/*
 *	Runs queued jobs one at a time on a single worker thread.
 *	stop() only takes effect between jobs, the job in flight always finishes.
 */
class TransferQueue
{
	public:
		using CompletedHandler = std::function<void(const QueuedJob&, bool, const std::string&)>;
		using DrainedHandler = std::function<void()>;
		using JobRunner = std::function<SendResult(const QueuedJob&)>;

		explicit TransferQueue(const ClientConfig& config);
		TransferQueue(const ClientConfig& config, JobRunner runner);
		~TransferQueue();

		TransferQueue(const TransferQueue&) = delete;
		TransferQueue& operator=(const TransferQueue&) = delete;

		uint64_t enqueue(QueuedJob job);

		void start();
		void stop();
		void clear();

		size_t count() const;
		bool is_processing() const { return running; }
		std::vector<std::string> pending() const;

		// handlers run on the worker thread
		void on_transfer_completed(CompletedHandler handler);
		void on_all_completed(DrainedHandler handler);

		// blocks until the worker thread has exited
		void wait_idle();

	private:
		ClientConfig config;
		JobRunner runner;

		std::mutex start_mutex;
		mutable std::mutex mutex;
		std::deque<QueuedJob> jobs;
		uint64_t next_id = 1;

		std::vector<CompletedHandler> completed_handlers;
		std::vector<DrainedHandler> drained_handlers;

		std::atomic<bool> running{false};
		std::atomic<bool> cancel_requested{false};
		bool worker_active = false;
		std::condition_variable idle_cv;
		std::thread worker;

		void worker_loop();
		SendResult run_job(const QueuedJob& job);

		void fire_completed(const QueuedJob& job, bool success, const std::string& error);
		void fire_drained();
};
