/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef STREAMDECODER_H
#define STREAMDECODER_H

#include <QByteArray>
#include <QString>
#include <QStringDecoder>

#include "synkprivate_export.h"

namespace Synk
{

/**
 * Incremental UTF-8 decoder for one session's output stream.
 *
 * A multi-byte sequence split across two chunks is held back until the rest
 * arrives. Malformed input decodes to U+FFFD and decoding carries on.
 */
class SYNKPRIVATE_EXPORT StreamDecoder
{
public:
    StreamDecoder();

    QString decode(const QByteArray &data);
    void reset();

private:
    QStringDecoder _decoder;
};

} // namespace Synk

#endif // STREAMDECODER_H
