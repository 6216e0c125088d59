///////////////////////////////////////////////////////////////////////////////
///
/// @file Descriptor.cpp
///
/// Everything learned about an image during preparation.
///
/// Copyright (c) 2005-2015 Parallels IP Holdings GmbH
///
/// This file is part of Virtuozzo Core. Virtuozzo Core is free
/// software; you can redistribute it and/or modify it under the terms
/// of the GNU General Public License as published by the Free Software
/// Foundation; either version 2 of the License, or (at your option) any
/// later version.
///
/// This program is distributed in the hope that it will be useful,
/// but WITHOUT ANY WARRANTY; without even the implied warranty of
/// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
/// GNU General Public License for more details.
///
/// You should have received a copy of the GNU General Public License
/// along with this program; if not, write to the Free Software
/// Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA
/// 02110-1301, USA.
///
/// Our contact details: Parallels IP Holdings GmbH, Vordergasse 59, 8200
/// Schaffhausen, Switzerland.
///
///////////////////////////////////////////////////////////////////////////////
#include "Descriptor.h"
#include "StringTable.h"

using namespace Image;

namespace
{

void section(QStringList &lines, const char *title, const QString &body)
{
	lines << QString(title);
	Q_FOREACH(const QString &line, body.split('\n', QString::SkipEmptyParts))
		lines << QString("    ") + line;
}

} // namespace

QString Descriptor::toString() const
{
	QStringList lines;
	section(lines, IDS_REPORT__IMAGE, m_info ? m_info->toString() : m_path);
	if (m_device)
		section(lines, IDS_REPORT__DEVICE, *m_device);
	section(lines, IDS_REPORT__MBR, m_mbr.toString());

	QStringList partitions;
	Q_FOREACH(const Partition::Record &record, m_partitions)
		partitions << record.toString();
	section(lines, IDS_REPORT__PARTITIONS, partitions.join("\n"));

	if (!m_groups.isEmpty())
	{
		QStringList groups;
		Q_FOREACH(const Lvm::Group &group, m_groups)
			groups << group.toString();
		section(lines, IDS_REPORT__GROUPS, groups.join("\n"));
	}

	if (m_fstabPath)
	{
		QStringList fstab;
		Q_FOREACH(const Fstab::Entry &entry, m_fstab)
			fstab << entry.toString();
		section(lines, IDS_REPORT__FSTAB, fstab.join("\n"));
	}
	if (m_resolution)
		section(lines, IDS_REPORT__ROOT, m_resolution->toString());

	if (!m_release.isEmpty())
	{
		section(lines, IDS_REPORT__OS, QString("%1 %2 (%3)")
				.arg(m_release.value("NAME"), m_release.value("VERSION_ID"), m_plugin));
	}
	if (m_bootloader)
		section(lines, IDS_REPORT__BOOTLOADER, m_bootloader->toString());

	if (!m_network.isEmpty())
	{
		QStringList network;
		Q_FOREACH(const Guest::Interface &iface, m_network)
			network << QString("%1 %2").arg(iface.m_file, iface.m_macs.join(" ")).trimmed();
		section(lines, IDS_REPORT__NETWORK, network.join("\n"));
	}

	if (m_verdict)
	{
		if (m_verdict->m_pass)
			lines << QString(IDS_REPORT__PASSED);
		else
			section(lines, IDS_REPORT__FAILED, m_verdict->m_reasons.join("\n"));
	}
	return lines.join("\n");
}
