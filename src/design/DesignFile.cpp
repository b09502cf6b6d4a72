#include "DesignFile.hpp"

#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "core/Errors.hpp"
#include "core/Utility.hpp"

using namespace std;

namespace {
	enum class Quantity { LENGTH, ANGLE, GAIN, PERCENT, MASS, RATIO };

	// factor to the stored unit, per quantity and unit name
	const map<Quantity, map<string, double>> UNITS = {
		{ Quantity::LENGTH,  { { "mm", 1 }, { "in", MM_PER_INCH } } },
		{ Quantity::ANGLE,   { { "rad", 1 }, { "deg", RAD_PER_DEG } } },
		{ Quantity::GAIN,    { { "rad/mm", 1 }, { "deg/in", RAD_PER_DEG / MM_PER_INCH } } },
		{ Quantity::PERCENT, { { "%", 1 } } },
		{ Quantity::MASS,    { { "kg", 1 } } },
		{ Quantity::RATIO,   { } },
	};

	struct TargetKey {
		Quantity quantity;
		double Target::* field;
	};

	const map<string, TargetKey> TARGET_KEYS = {
		{ "wheelbase",           { Quantity::LENGTH,  &Target::wheelbase } },
		{ "weight_distribution", { Quantity::PERCENT, &Target::weight_distribution } },
		{ "sprung_mass",         { Quantity::MASS,    &Target::sprung_mass } },
		{ "ride_height",         { Quantity::LENGTH,  &Target::ride_height } },
		{ "rake",                { Quantity::ANGLE,   &Target::rake } },
		{ "loaded_radius",       { Quantity::LENGTH,  &Target::loaded_radius } },
		{ "track",               { Quantity::LENGTH,  &Target::track } },
		{ "toe",                 { Quantity::ANGLE,   &Target::toe } },
		{ "pitch_center",        { Quantity::PERCENT, &Target::pitch_center } },
		{ "caster",              { Quantity::ANGLE,   &Target::caster } },
		{ "caster_gain",         { Quantity::GAIN,    &Target::caster_gain } },
		{ "roll_center",         { Quantity::PERCENT, &Target::roll_center } },
		{ "camber",              { Quantity::ANGLE,   &Target::camber } },
		{ "camber_gain",         { Quantity::GAIN,    &Target::camber_gain } },
		{ "scrub",               { Quantity::LENGTH,  &Target::scrub } },
		{ "kpi",                 { Quantity::ANGLE,   &Target::kpi } },
		{ "ride_ratio",          { Quantity::RATIO,   &Target::ride_ratio } },
		{ "arb_ratio",           { Quantity::RATIO,   &Target::arb_ratio } },
	};

	// parses one line at a time, errors carry the file and line
	class LineParser {
	public:
		LineParser(const string& filename, int line_number, const string& line) :
			filename_(filename),
			line_number_(line_number)
		{
			stringstream ss(line);
			string token;
			while (ss >> token)
				tokens_.push_back(token);
		}

		const vector<string>&	tokens() const { return tokens_; }

		[[noreturn]] void fail(const string& what) const
		{
			throw ConfigError(filename_, line_number_, what);
		}

		double number(size_t index) const
		{
			if (index >= tokens_.size())
				fail(tokens_[0] + " is missing a value");
			const string& token = tokens_[index];
			try {
				size_t used = 0;
				double value = stod(token, &used);
				if (used != token.size())
					fail("Not a number: " + token);
				return value;
			}
			catch (const invalid_argument&) {
				fail("Not a number: " + token);
			}
			catch (const out_of_range&) {
				fail("Number out of range: " + token);
			}
		}

		// conversion factor of the optional trailing unit, 1 when there is none
		double unitFactor(Quantity quantity, size_t value_count) const
		{
			size_t expected = value_count + 1;
			if (tokens_.size() == expected)
				return 1;
			if (tokens_.size() != expected + 1)
				fail(tokens_[0] + " expects " + to_string(value_count) + " value(s) and an optional unit");

			const string& unit = tokens_.back();
			const map<string, double>& units = UNITS.at(quantity);
			auto it = units.find(unit);
			if (it == units.end())
				fail("Unit " + unit + " not valid for " + tokens_[0]);
			return it->second;
		}

	private:
		string			filename_;
		int				line_number_;
		vector<string>	tokens_;
	};

	LinkageType parseLinkage(const LineParser& p)
	{
		if (p.tokens().size() != 2)
			p.fail("linkage expects one value");
		const string& value = p.tokens()[1];
		if (value == "double_wishbone") return LinkageType::DOUBLE_WISHBONE;
		if (value == "multilink") return LinkageType::MULTILINK;
		p.fail("Unknown linkage type: " + value);
	}

	AxleType parseAxle(const LineParser& p)
	{
		if (p.tokens().size() != 2)
			p.fail("axle expects one value");
		const string& value = p.tokens()[1];
		if (value == "front") return AxleType::FRONT;
		if (value == "rear") return AxleType::REAR;
		p.fail("Unknown axle: " + value);
	}

	void parseBound(const LineParser& p, BoundTable& bounds)
	{
		if (p.tokens().size() < 2)
			p.fail("bound expects a point key");

		const string& key = p.tokens()[1];
		const PointSpec* spec = findPointSpec(key);
		if (!spec)
			p.fail("Unknown design point: " + key);

		// the key counts as the first value for the unit lookup
		double factor = p.unitFactor(Quantity::LENGTH, 7);

		DesignBound bound;
		for (int axis = 0; axis < 3; axis++) {
			bound.range(axis, 0) = p.number(2 + 2 * axis) * factor;
			bound.range(axis, 1) = p.number(3 + 2 * axis) * factor;
		}
		bounds[spec->id] = bound;
	}
}

DesignFile loadDesignFile(const string& filename)
{
	ifstream file_input(filename, ios::in);
	if (!file_input)
		throw ConfigError(filename, 0, "Could not open design file");

	DesignFile design;
	bool has_cg_longitudinal = false;

	string line;
	int line_number = 0;
	while (getline(file_input, line)) {
		line_number++;

		LineParser p(filename, line_number, line);
		if (p.tokens().empty() || p.tokens()[0][0] == '#') continue;

		const string& key = p.tokens()[0];

		if (key == "name") {
			if (p.tokens().size() != 2)
				p.fail("name expects one value");
			design.name = p.tokens()[1];
		}
		else if (key == "linkage") {
			design.target.linkage = parseLinkage(p);
		}
		else if (key == "axle") {
			design.target.axle = parseAxle(p);
		}
		else if (key == "cg_height") {
			double factor = p.unitFactor(Quantity::LENGTH, 1);
			design.target.cg.z() = p.number(1) * factor;
		}
		else if (key == "cg_longitudinal") {
			double factor = p.unitFactor(Quantity::LENGTH, 1);
			design.target.cg.x() = p.number(1) * factor;
			has_cg_longitudinal = true;
		}
		else if (key == "bound") {
			parseBound(p, design.bounds);
		}
		else {
			auto it = TARGET_KEYS.find(key);
			if (it == TARGET_KEYS.end())
				p.fail("Unknown key: " + key);

			double factor = p.unitFactor(it->second.quantity, 1);
			design.target.*(it->second.field) = p.number(1) * factor;
		}
	}

	if (!has_cg_longitudinal) {
		const Target& t = design.target;
		design.target.cg.x() = axleOffsetFromCg(t.wheelbase, t.weight_distribution, t.axle);
	}

	return design;
}
