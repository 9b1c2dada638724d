/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 1/7/18.
//

#pragma once

#include <boost/exception/exception.hpp>
#include <boost/exception/error_info.hpp>

#include <string>
#include <system_error>

namespace imagio {

struct Exception : virtual boost::exception, virtual std::exception
{
	const char* what() const noexcept override ;
};

struct SystemError : virtual Exception {};
using ErrorCode = boost::error_info<struct tag_error_code, std::error_code>;
using StorageKeyInfo = boost::error_info<struct tag_storage_key, std::string>;

} // end of namespace
