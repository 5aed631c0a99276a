#pragma once

#include "network/types.hpp"

namespace relay::node {

//! What the dispatcher needs to know about the parent node.
class IClusterLink {
public:
	virtual ~IClusterLink()                                      = default;
	virtual bool hasParent() const                               = 0; //!< Connected to a parent right now.
	virtual bool isUnified() const                               = 0; //!< Parent negotiated unified cluster mode.
	virtual void sendToParent(const network::Message& message)   = 0; //!< No-op without a parent.
};

} // namespace relay::node
