#pragma once
#include <stdexcept>
#include <string>

// base of every error raised while building or solving a suspension system
class SuspensionError : public std::runtime_error {
public:
	explicit SuspensionError(const std::string& what) : std::runtime_error(what) {}
};

// malformed, cyclic or unrooted frame topology
class GraphConstructionError : public SuspensionError {
public:
	explicit GraphConstructionError(const std::string& what) : SuspensionError(what) {}
};

class FrameNotFoundError : public SuspensionError {
public:
	explicit FrameNotFoundError(const std::string& frame)
		: SuspensionError("Frame does not exist: " + frame), frame_(frame) {}

	const std::string& frame() const { return frame_; }

private:
	std::string frame_;
};

class PointNotFoundError : public SuspensionError {
public:
	PointNotFoundError(const std::string& point, const std::string& frame)
		: SuspensionError("Point " + point + " does not exist in frame " + frame), point_(point), frame_(frame) {}

	const std::string& point() const { return point_; }
	const std::string& frame() const { return frame_; }

private:
	std::string point_;
	std::string frame_;
};

class UnsupportedLinkageType : public SuspensionError {
public:
	explicit UnsupportedLinkageType(const std::string& what) : SuspensionError(what) {}
};

class NotImplementedError : public SuspensionError {
public:
	explicit NotImplementedError(const std::string& what) : SuspensionError(what) {}
};

// bad bound tables and bad sample requests
class DesignSpaceError : public SuspensionError {
public:
	explicit DesignSpaceError(const std::string& what) : SuspensionError(what) {}
};

// closed-form geometry that has no unique answer (collinear points, parallel planes)
class GeometryError : public SuspensionError {
public:
	explicit GeometryError(const std::string& what) : SuspensionError(what) {}
};

class ConfigError : public SuspensionError {
public:
	ConfigError(const std::string& file, int line, const std::string& what)
		: SuspensionError(file + ":" + std::to_string(line) + ": " + what), line_(line) {}

	int line() const { return line_; }

private:
	int line_;
};
