/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 3/9/24.
//

#pragma once

#include <ostream>
#include <boost/beast/http/status.hpp>

#include <system_error>

namespace imagio {

enum class Error
{
	ok,
	object_not_exist,       //!< key or uuid absent
	decode_error,           //!< malformed or unsupported image
	backend_error,          //!< storage or database I/O failure
	config_error,           //!< invalid backend configuration

	unknown_error
};

const std::error_category& imagio_error_category();
std::error_code make_error_code(Error err);

// Status code the routing layer should answer with for a failure
boost::beast::http::status http_status(std::error_code ec);

} // end of namespace imagio

namespace std
{
	template <> struct is_error_code_enum<imagio::Error> : true_type {};
}
