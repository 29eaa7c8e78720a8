#pragma once
#include <JEVT/Containers/Vector.hpp>
#include <JEVT/Defines.hpp>
#include <JEVT/IO/ByteConcepts.hpp>
#include <JEVT/IO/File.hpp>
#include <JEVT/IO/IByteReader.hpp>
#include <JEVT/IO/IOError.hpp>
#include <JEVT/IO/MemoryReader.hpp>
#include <JEVT/IO/MemoryWriter.hpp>
#include <JEVT/Primitives.hpp>
#include <JEVT/Serialization/Core/ParseError.hpp>
#include <JEVT/Serialization/JSON/JsonCanonicalize.hpp>
#include <JEVT/Serialization/JSON/JsonError.hpp>
#include <JEVT/Serialization/JSON/JsonEvent.hpp>
#include <JEVT/Serialization/JSON/JsonEventWriter.hpp>
#include <JEVT/Serialization/JSON/JsonLexical.hpp>
#include <JEVT/Serialization/JSON/JsonReader.hpp>
#include <JEVT/Serialization/JSON/JsonTokenizer.hpp>
#include <JEVT/Serialization/JSON/JsonWriter.hpp>
