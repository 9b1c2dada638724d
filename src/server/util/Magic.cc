/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 1/20/18.
//

#include "Magic.hh"

#include "common/util/Log.hh"

namespace imagio {

Magic::Magic() : m_cookie{::magic_open(MAGIC_MIME_TYPE)}
{
	if (!m_cookie)
		Log(LOG_WARNING, "magic_open() failed, all MIME types will be application/octet-stream");
	else if (::magic_load(m_cookie, nullptr) != 0)
	{
		auto error = ::magic_error(m_cookie);
		Log(LOG_WARNING, "cannot load magic database: %1%", error ? error : "unknown error");
	}
}

Magic::~Magic()
{
	if (m_cookie)
		::magic_close(m_cookie);
}

const Magic& Magic::instance()
{
	static const Magic inst;
	return inst;
}

std::string Magic::mime(BufferView buf) const
{
	return mime(buf.data(), buf.size());
}

std::string Magic::mime(const void *buffer, std::size_t size) const
{
	std::unique_lock lock{m_mx};
	auto result = ::magic_buffer(m_cookie, buffer, size);
	return result ? std::string{result} : std::string{"application/octet-stream"};
}

} // end of namespace
