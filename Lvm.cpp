///////////////////////////////////////////////////////////////////////////////
///
/// @file Lvm.cpp
///
/// LVM2 volume group scan, activation and deactivation.
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
#include <QRegExp>
#include <QStringList>

#include "Lvm.h"
#include "StringTable.h"

namespace Lvm
{

namespace
{
const char PVSCAN[] = "pvscan";
const char PVS[] = "pvs";
const char VGS[] = "vgs";
const char VGSCAN[] = "vgscan";
const char LVSCAN[] = "lvscan";
const char VGCHANGE[] = "vgchange";

QString escape(QString name)
{
	return name.replace("-", "--");
}

} // namespace

QString getMapperName(const QString &group, const QString &volume)
{
	return escape(group) + "-" + escape(volume);
}

////////////////////////////////////////////////////////////
// Group

QString Group::toString() const
{
	QStringList volumes;
	Q_FOREACH(const Logical &lv, m_volumes)
		volumes << QString("%1 (%2)").arg(lv.getName(), lv.getMapper());
	return QString("%1: %2").arg(m_name, volumes.join(", "));
}

GroupList parseLvscan(const QByteArray &out, const QSet<QString> &excluded)
{
	// VG and LV identifiers may contain only symbols from [a-zA-Z0-9._+-].
	//                          |  vg_name       |  lv_name       |
	QRegExp inactiveRE("^\\s*inactive\\s+'/dev/([a-zA-Z0-9._+-]+)/([a-zA-Z0-9._+-]+)'");

	GroupList groups;
	QStringList lines = QString::fromUtf8(out).split('\n', QString::SkipEmptyParts);
	Q_FOREACH(const QString &line, lines)
	{
		if (inactiveRE.indexIn(line) == -1)
			continue;
		QString vg = inactiveRE.cap(1);
		if (excluded.contains(vg))
		{
			Logger::info(QString("Skipping host volume group %1").arg(vg));
			continue;
		}
		Logger::info(QString("lvscan: %1").arg(line.trimmed()));

		int i = 0;
		for (; i < groups.size(); ++i)
		{
			if (groups[i].getName() == vg)
				break;
		}
		if (i == groups.size())
			groups << Group(vg);
		groups[i].addVolume(inactiveRE.cap(2));
	}
	return groups;
}

QSet<QString> parseNames(const QByteArray &out)
{
	QSet<QString> names;
	QStringList lines = QString::fromUtf8(out).split('\n', QString::SkipEmptyParts);
	Q_FOREACH(const QString &line, lines)
	{
		QString name = line.trimmed();
		if (!name.isEmpty())
			names.insert(name);
	}
	return names;
}

////////////////////////////////////////////////////////////
// Handler

Expected<QSet<QString> > Handler::snapshotHost() const
{
	Expected<QByteArray> out = m_adapter.execute(VGS,
			QStringList() << "--noheadings" << "-o" << "vg_name");
	if (!out.isOk())
		return out;
	QSet<QString> names = parseNames(out.get());
	Logger::info(QString("Host volume groups: %1").arg(QStringList(names.toList()).join(" ")));
	return names;
}

Expected<void> Handler::checkCollision(const QString &physical, const QSet<QString> &host) const
{
	Expected<QByteArray> out = m_adapter.execute(PVS,
			QStringList() << "--noheadings" << "-o" << "vg_name" << physical);
	if (!out.isOk())
		return out;
	Q_FOREACH(const QString &vg, parseNames(out.get()))
	{
		if (host.contains(vg))
		{
			return Expected<void>::fromMessage(
					QString(IDS_ERR_VG_COLLISION).arg(vg), ERR_VG_COLLISION);
		}
	}
	return Expected<void>();
}

Expected<GroupList> Handler::rescan(const QStringList &physicals, const QSet<QString> &host) const
{
	Expected<void> res;
	Q_FOREACH(const QString &physical, physicals)
	{
		Expected<QByteArray> out = m_adapter.execute(PVSCAN, QStringList() << "--cache" << physical);
		if (!out.isOk())
			return out;
		if (!(res = checkCollision(physical, host)).isOk())
			return res;
	}

	Expected<QByteArray> out = m_adapter.execute(VGSCAN, QStringList() << "--verbose");
	if (!out.isOk())
		return out;
	out = m_adapter.execute(LVSCAN, QStringList() << "--verbose");
	if (!out.isOk())
		return out;

	return parseLvscan(out.get(), host);
}

Expected<void> Handler::activate(const GroupList &groups) const
{
	if (groups.isEmpty())
		return Expected<void>();

	Expected<Exec::Result> res = m_adapter.run(VGCHANGE, QStringList() << "--activate" << "y");
	if (!res.isOk())
		return res;

	// vgchange reports partial failures with exit code 5, so rely on output.
	QString text = res.get().getText();
	Q_FOREACH(const Group &group, groups)
	{
		// Names are quoted: volume group "ol" now active.
		QRegExp nameRE(QString("\"%1\"").arg(QRegExp::escape(group.getName())));
		if (nameRE.indexIn(text) == -1)
		{
			return Expected<void>::fromMessage(
					QString(IDS_ERR_ACTIVATION_FAILED).arg(group.getName()), ERR_ACTIVATION_FAILED);
		}
		Logger::info(QString("Activated volume group %1").arg(group.getName()));
	}
	return Expected<void>();
}

void Handler::deactivate(const GroupList &groups) const
{
	Q_FOREACH(const Group &group, groups)
	{
		Expected<QByteArray> out = m_adapter.execute(VGCHANGE,
				QStringList() << "--activate" << "n" << group.getName());
		if (!out.isOk())
			Logger::error(out.getMessage());

		// Drop the group's PVs from lvmetad's view.
		out = m_adapter.execute(PVSCAN, QStringList() << "--cache");
		if (!out.isOk())
			Logger::error(out.getMessage());
	}
}

} // namespace Lvm
