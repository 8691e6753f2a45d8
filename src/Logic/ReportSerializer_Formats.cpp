#include "ReportSerializer.h"

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <yaml-cpp/yaml.h>

#include <string>

namespace
{
	template <typename Writer>
	void WriteString(Writer &writer, const std::string &value)
	{
		writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
	}
}

std::string ReportSerializer::ToJson(const OutputDocument &document)
{
	rapidjson::StringBuffer buffer;
	rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);

	writer.StartObject();
	writer.Key("command");
	WriteString(writer, document.command);
	writer.Key("path");
	WriteString(writer, document.path);
	writer.Key("preview");
	writer.Bool(document.preview);

	writer.Key("operations");
	writer.StartArray();
	for (const auto &row : document.rows)
	{
		writer.StartObject();
		writer.Key("action");
		WriteString(writer, row.action);
		writer.Key("source");
		WriteString(writer, row.source);
		writer.Key("destination");
		if (row.destination.empty())
		{
			writer.Null();
		}
		else
		{
			WriteString(writer, row.destination);
		}
		writer.Key("status");
		WriteString(writer, row.status);
		writer.Key("detail");
		WriteString(writer, row.detail);
		writer.EndObject();
	}
	writer.EndArray();

	writer.Key("files");
	writer.StartArray();
	for (const auto &file : document.files)
	{
		WriteString(writer, file);
	}
	writer.EndArray();

	writer.Key("counts");
	writer.StartObject();
	for (const auto &count : document.counts)
	{
		writer.Key(count.first.c_str(), static_cast<rapidjson::SizeType>(count.first.size()));
		writer.Uint64(count.second);
	}
	writer.EndObject();

	writer.Key("summary");
	WriteString(writer, document.summary);
	writer.EndObject();

	return std::string(buffer.GetString(), buffer.GetSize()) + "\n";
}

std::string ReportSerializer::ToYaml(const OutputDocument &document)
{
	YAML::Emitter out;
	out << YAML::BeginMap;
	out << YAML::Key << "command" << YAML::Value << document.command;
	out << YAML::Key << "path" << YAML::Value << document.path;
	out << YAML::Key << "preview" << YAML::Value << document.preview;

	out << YAML::Key << "operations" << YAML::Value << YAML::BeginSeq;
	for (const auto &row : document.rows)
	{
		out << YAML::BeginMap;
		out << YAML::Key << "action" << YAML::Value << row.action;
		out << YAML::Key << "source" << YAML::Value << row.source;
		out << YAML::Key << "destination" << YAML::Value;
		if (row.destination.empty())
		{
			out << YAML::Null;
		}
		else
		{
			out << row.destination;
		}
		out << YAML::Key << "status" << YAML::Value << row.status;
		out << YAML::Key << "detail" << YAML::Value << row.detail;
		out << YAML::EndMap;
	}
	out << YAML::EndSeq;

	out << YAML::Key << "files" << YAML::Value << YAML::BeginSeq;
	for (const auto &file : document.files)
	{
		out << file;
	}
	out << YAML::EndSeq;

	out << YAML::Key << "counts" << YAML::Value << YAML::BeginMap;
	for (const auto &count : document.counts)
	{
		out << YAML::Key << count.first << YAML::Value << static_cast<unsigned long long>(count.second);
	}
	out << YAML::EndMap;

	out << YAML::Key << "summary" << YAML::Value << document.summary;
	out << YAML::EndMap;

	return std::string(out.c_str()) + "\n";
}
