/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 1/20/18.
//

#pragma once

#include "common/util/BufferView.hh"

#include <magic.h>

#include <mutex>
#include <string>

namespace imagio {

class Magic
{
public:
	Magic();
	Magic(const Magic&) = delete;
	Magic(Magic&&) = delete;
	~Magic();

	Magic& operator=(const Magic&) = delete;
	Magic& operator=(Magic&&) = delete;

	std::string mime(const void *buffer, std::size_t size) const;
	std::string mime(BufferView buf) const;

	static const Magic& instance();

private:
	::magic_t m_cookie;

	// libmagic cookies must not be used by more than one thread at a time
	mutable std::mutex m_mx;
};

} // end of namespace
