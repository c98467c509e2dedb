#pragma once

#include <spdlog/spdlog.h>

#include <utility>

namespace items_service
{

// Logger for RESTinio's server traits.
//
// RESTinio passes lambdas that build the message. A lambda is called
// only if the level is enabled in spdlog's default logger.
class spdlog_logger_t
{
	template<typename Message_Builder>
	static void
	log_if_enabled(spdlog::level::level_enum level, Message_Builder && builder)
	{
		auto * logger = spdlog::default_logger_raw();
		if(logger->should_log(level))
			logger->log(level, "[restinio] {}", builder());
	}

public:
	template<typename Message_Builder>
	void trace(Message_Builder && builder)
	{
		log_if_enabled(spdlog::level::trace,
				std::forward<Message_Builder>(builder));
	}

	template<typename Message_Builder>
	void info(Message_Builder && builder)
	{
		log_if_enabled(spdlog::level::info,
				std::forward<Message_Builder>(builder));
	}

	template<typename Message_Builder>
	void warn(Message_Builder && builder)
	{
		log_if_enabled(spdlog::level::warn,
				std::forward<Message_Builder>(builder));
	}

	template<typename Message_Builder>
	void error(Message_Builder && builder)
	{
		log_if_enabled(spdlog::level::err,
				std::forward<Message_Builder>(builder));
	}
};

} /* namespace items_service */
