/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 3/9/24.
//

#include "Error.hh"

#include <string>

namespace imagio {

const std::error_category& imagio_error_category()
{
	struct Cat : std::error_category
	{
		Cat() = default;
		const char *name() const noexcept override { return "imagio"; }

		std::string message(int ev) const override
		{
			switch (static_cast<Error>(ev))
			{
				case Error::ok: return "no error";
				case Error::object_not_exist: return "object not exist";
				case Error::decode_error: return "cannot decode image";
				case Error::backend_error: return "storage backend error";
				case Error::config_error: return "invalid configuration";
				default: return "unknown error " + std::to_string(ev);
			}
		}
	};
	static const Cat cat;
	return cat;
}

std::error_code make_error_code(Error err)
{
	return std::error_code(static_cast<int>(err), imagio_error_category());
}

boost::beast::http::status http_status(std::error_code ec)
{
	using boost::beast::http::status;
	if (!ec)
		return status::ok;
	else if (ec == Error::object_not_exist)
		return status::not_found;
	else if (ec == Error::decode_error)
		return status::bad_request;
	else
		return status::internal_server_error;
}

} // end of namespace
