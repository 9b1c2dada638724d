/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 6/25/18.
//

#pragma once

#include "common/util/BufferView.hh"
#include "common/util/Size2D.hh"

#include <opencv2/core/mat.hpp>

namespace imagio {

/// Random noise image of the given size and OpenCV type, e.g. CV_8UC3.
cv::Mat random_image(Size2D size, int type = CV_8UC3);

Blob random_jpeg(Size2D size, int quality = 90);
Blob random_png(Size2D size, int type = CV_8UC3);

} // end of namespace
