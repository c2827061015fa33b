/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "StreamDecoder.h"

namespace Synk
{

StreamDecoder::StreamDecoder()
    : _decoder(QStringConverter::Utf8)
{
}

QString StreamDecoder::decode(const QByteArray &data)
{
    if (data.isEmpty()) {
        return QString();
    }
    return _decoder.decode(data);
}

void StreamDecoder::reset()
{
    _decoder.resetState();
}

} // namespace Synk
