#pragma once

#include <cstdint>
#include <memory>

namespace relay {
namespace network {

//! Plain HTTP endpoint for infrastructure health checks.
//! Answers every request with "200 OK" and the body "Ok", then closes.
class HealthServer {
public:
	explicit HealthServer(std::uint16_t port);
	~HealthServer();

	HealthServer(const HealthServer&)            = delete;
	HealthServer& operator=(const HealthServer&) = delete;

	bool start(); //!< Returns false if the port could not be bound.
	void stop();

	std::uint16_t port() const;

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl;
};

} // namespace network
} // namespace relay
