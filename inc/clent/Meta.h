
//
// ===============================================================================
// clEntity, Meta.h - Runtime entity metadata that generated code registers
// itself with.
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//


#pragma once


#include <cstddef>
#include <deque>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>


namespace clent
{
	struct TypeDescriptor;


	enum Cardinality
	{
		CARDINALITY_NONE,
		ONE_TO_ONE,
		ONE_TO_MANY,
		MANY_TO_ONE,
		MANY_TO_MANY,
	};


	// Per-property load/modification state held by generated entities
	enum PropertyState
	{
		STATE_FETCH,
		STATE_LOADED,
		STATE_MODIFIED,
	};


	// Which builder produced the attribute
	enum AttributeKind
	{
		ATTRIBUTE_BASIC,
		ATTRIBUTE_LIST,
		ATTRIBUTE_SET,
		ATTRIBUTE_COLLECTION,
		ATTRIBUTE_MAP,
	};


	typedef std::vector< std::pair<std::string, PropertyState> > PropertyStates;
	typedef std::function<PropertyState (const void*)> PropertyStateSupplier;


	struct AttributeDescriptor
	{
		AttributeDescriptor()
			: kind(ATTRIBUTE_BASIC)
			, cardinality(CARDINALITY_NONE)
			, is_key(false)
			, is_version(false)
			, is_nullable(false)
			, is_generated(false)
			, is_read_only(false)
			, is_lazy(false)
			, referenced_type(0)
			, declaring_type(0)
		{
		}

		// Column name
		std::string name;

		std::string property_name;
		std::string getter_name;
		std::string setter_name;

		AttributeKind kind;
		Cardinality cardinality;

		bool is_key;
		bool is_version;
		bool is_nullable;
		bool is_generated;
		bool is_read_only;
		bool is_lazy;

		const TypeDescriptor* referenced_type;
		const TypeDescriptor* declaring_type;

		// Empty for immutable, embeddable and superclass types
		PropertyStateSupplier property_state;
	};


	struct TypeDescriptor
	{
		TypeDescriptor()
			: class_type(0)
			, is_read_only(false)
			, is_stateless(false)
			, is_immutable(false)
			, is_cacheable(true)
			, is_view(false)
		{
		}

		const AttributeDescriptor* GetAttribute(const std::string& property_name) const
		{
			for (size_t i = 0; i < attributes.size(); i++)
			{
				if (attributes[i]->property_name == property_name)
					return attributes[i];
			}
			return 0;
		}

		std::vector<const AttributeDescriptor*> GetKeyAttributes() const
		{
			std::vector<const AttributeDescriptor*> keys;
			for (size_t i = 0; i < attributes.size(); i++)
			{
				if (attributes[i]->is_key)
					keys.push_back(attributes[i]);
			}
			return keys;
		}

		// Table or view name
		std::string name;

		std::string class_name;
		const std::type_info* class_type;

		bool is_read_only;
		bool is_stateless;
		bool is_immutable;
		bool is_cacheable;
		bool is_view;

		std::vector<const AttributeDescriptor*> attributes;
	};


	//
	// Chained population of an attribute descriptor
	//
	class AttributeBuilder
	{
	public:
		AttributeBuilder(AttributeDescriptor& attribute, AttributeKind kind, const char* property_name, const char* column_name)
			: m_Attribute(attribute)
		{
			m_Attribute.kind = kind;
			m_Attribute.property_name = property_name;
			m_Attribute.name = column_name;
		}

		AttributeBuilder& SetGetter(const char* name) { m_Attribute.getter_name = name; return *this; }
		AttributeBuilder& SetSetter(const char* name) { m_Attribute.setter_name = name; return *this; }
		AttributeBuilder& SetKey(bool key) { m_Attribute.is_key = key; return *this; }
		AttributeBuilder& SetVersion(bool version) { m_Attribute.is_version = version; return *this; }
		AttributeBuilder& SetNullable(bool nullable) { m_Attribute.is_nullable = nullable; return *this; }
		AttributeBuilder& SetGenerated(bool generated) { m_Attribute.is_generated = generated; return *this; }
		AttributeBuilder& SetReadOnly(bool read_only) { m_Attribute.is_read_only = read_only; return *this; }
		AttributeBuilder& SetLazy(bool lazy) { m_Attribute.is_lazy = lazy; return *this; }
		AttributeBuilder& SetCardinality(Cardinality cardinality) { m_Attribute.cardinality = cardinality; return *this; }
		AttributeBuilder& SetReferencedType(const TypeDescriptor* type) { m_Attribute.referenced_type = type; return *this; }

		AttributeBuilder& SetPropertyState(const PropertyStateSupplier& supplier)
		{
			m_Attribute.property_state = supplier;
			return *this;
		}

	private:
		AttributeDescriptor& m_Attribute;
	};


	inline AttributeBuilder Build(AttributeDescriptor& attribute, const char* property_name, const char* column_name)
	{
		return AttributeBuilder(attribute, ATTRIBUTE_BASIC, property_name, column_name);
	}
	inline AttributeBuilder BuildList(AttributeDescriptor& attribute, const char* property_name, const char* column_name)
	{
		return AttributeBuilder(attribute, ATTRIBUTE_LIST, property_name, column_name);
	}
	inline AttributeBuilder BuildSet(AttributeDescriptor& attribute, const char* property_name, const char* column_name)
	{
		return AttributeBuilder(attribute, ATTRIBUTE_SET, property_name, column_name);
	}
	inline AttributeBuilder BuildCollection(AttributeDescriptor& attribute, const char* property_name, const char* column_name)
	{
		return AttributeBuilder(attribute, ATTRIBUTE_COLLECTION, property_name, column_name);
	}
	inline AttributeBuilder BuildMap(AttributeDescriptor& attribute, const char* property_name, const char* column_name)
	{
		return AttributeBuilder(attribute, ATTRIBUTE_MAP, property_name, column_name);
	}


	//
	// Chained population of a type descriptor
	//
	class TypeBuilder
	{
	public:
		TypeBuilder(TypeDescriptor& type, const char* name, const char* class_name, const std::type_info& class_type)
			: m_Type(type)
		{
			m_Type.name = name;
			m_Type.class_name = class_name;
			m_Type.class_type = &class_type;
		}

		TypeBuilder& SetReadOnly(bool read_only) { m_Type.is_read_only = read_only; return *this; }
		TypeBuilder& SetStateless(bool stateless) { m_Type.is_stateless = stateless; return *this; }
		TypeBuilder& SetImmutable(bool immutable) { m_Type.is_immutable = immutable; return *this; }
		TypeBuilder& SetCacheable(bool cacheable) { m_Type.is_cacheable = cacheable; return *this; }
		TypeBuilder& SetView(bool view) { m_Type.is_view = view; return *this; }

		TypeBuilder& AddAttribute(AttributeDescriptor& attribute)
		{
			attribute.declaring_type = &m_Type;
			m_Type.attributes.push_back(&attribute);
			return *this;
		}

	private:
		TypeDescriptor& m_Type;
	};


	//
	// Base of every generated entity implementation
	//
	class Persistable
	{
	public:
		virtual ~Persistable() { }

		virtual const TypeDescriptor& GetType() const = 0;
		virtual PropertyStates GetPropertyStates() const = 0;
		virtual std::string ToString() const = 0;
		virtual size_t Hash() const = 0;
	};


	//
	// Hashing of property values for generated Hash() implementations. Specialise Hasher for
	// property types that std::hash doesn't cover.
	//
	inline void HashCombine(size_t& seed, size_t value)
	{
		seed ^= value + 0x9e3779b9 + (seed << 6) + (seed >> 2);
	}

	template <typename TYPE>
	struct Hasher
	{
		size_t operator () (const TYPE& value) const
		{
			return std::hash<TYPE>()(value);
		}
	};

	template <typename TYPE>
	void HashValue(size_t& seed, const TYPE& value)
	{
		HashCombine(seed, Hasher<TYPE>()(value));
	}

	template <typename CONTAINER>
	size_t HashRange(const CONTAINER& container)
	{
		size_t seed = container.size();
		for (typename CONTAINER::const_iterator i = container.begin(); i != container.end(); ++i)
			HashValue(seed, *i);
		return seed;
	}

	template <typename TYPE, typename ALLOC>
	struct Hasher< std::vector<TYPE, ALLOC> >
	{
		size_t operator () (const std::vector<TYPE, ALLOC>& value) const { return HashRange(value); }
	};

	template <typename TYPE, typename ALLOC>
	struct Hasher< std::list<TYPE, ALLOC> >
	{
		size_t operator () (const std::list<TYPE, ALLOC>& value) const { return HashRange(value); }
	};

	template <typename TYPE, typename ALLOC>
	struct Hasher< std::deque<TYPE, ALLOC> >
	{
		size_t operator () (const std::deque<TYPE, ALLOC>& value) const { return HashRange(value); }
	};

	template <typename TYPE, typename COMPARE, typename ALLOC>
	struct Hasher< std::set<TYPE, COMPARE, ALLOC> >
	{
		size_t operator () (const std::set<TYPE, COMPARE, ALLOC>& value) const { return HashRange(value); }
	};

	template <typename TYPE, typename COMPARE, typename ALLOC>
	struct Hasher< std::multiset<TYPE, COMPARE, ALLOC> >
	{
		size_t operator () (const std::multiset<TYPE, COMPARE, ALLOC>& value) const { return HashRange(value); }
	};

	template <typename KEY, typename VALUE>
	struct Hasher< std::pair<KEY, VALUE> >
	{
		size_t operator () (const std::pair<KEY, VALUE>& value) const
		{
			size_t seed = 0;
			HashValue(seed, value.first);
			HashValue(seed, value.second);
			return seed;
		}
	};

	template <typename KEY, typename VALUE, typename COMPARE, typename ALLOC>
	struct Hasher< std::map<KEY, VALUE, COMPARE, ALLOC> >
	{
		size_t operator () (const std::map<KEY, VALUE, COMPARE, ALLOC>& value) const { return HashRange(value); }
	};

	template <typename KEY, typename VALUE, typename COMPARE, typename ALLOC>
	struct Hasher< std::multimap<KEY, VALUE, COMPARE, ALLOC> >
	{
		size_t operator () (const std::multimap<KEY, VALUE, COMPARE, ALLOC>& value) const { return HashRange(value); }
	};

	// Iteration order of equal unordered containers can differ so element hashes are summed
	template <typename CONTAINER>
	size_t HashUnorderedRange(const CONTAINER& container)
	{
		size_t sum = 0;
		for (typename CONTAINER::const_iterator i = container.begin(); i != container.end(); ++i)
			sum += Hasher<typename CONTAINER::value_type>()(*i);
		size_t seed = container.size();
		HashCombine(seed, sum);
		return seed;
	}

	template <typename TYPE, typename HASH, typename EQUAL, typename ALLOC>
	struct Hasher< std::unordered_set<TYPE, HASH, EQUAL, ALLOC> >
	{
		size_t operator () (const std::unordered_set<TYPE, HASH, EQUAL, ALLOC>& value) const { return HashUnorderedRange(value); }
	};

	template <typename KEY, typename VALUE, typename HASH, typename EQUAL, typename ALLOC>
	struct Hasher< std::unordered_map<KEY, VALUE, HASH, EQUAL, ALLOC> >
	{
		size_t operator () (const std::unordered_map<KEY, VALUE, HASH, EQUAL, ALLOC>& value) const { return HashUnorderedRange(value); }
	};


	//
	// Text conversion of property values for generated ToString() implementations
	//
	template <typename TYPE, typename ENABLE = void>
	struct TextWriter
	{
		static std::string Write(const TYPE&) { return "{...}"; }
	};

	template <typename TYPE>
	struct TextWriter<TYPE, typename std::enable_if<std::is_arithmetic<TYPE>::value>::type>
	{
		static std::string Write(const TYPE& value)
		{
			std::ostringstream stream;
			stream << std::boolalpha << value;
			return stream.str();
		}
	};

	template <>
	struct TextWriter<std::string>
	{
		static std::string Write(const std::string& value) { return value; }
	};

	template <typename TYPE>
	struct TextWriter<TYPE*>
	{
		static std::string Write(TYPE* value)
		{
			if (value == 0)
				return "null";
			std::ostringstream stream;
			stream << static_cast<const void*>(value);
			return stream.str();
		}
	};

	template <typename TYPE>
	std::string ToText(const TYPE& value)
	{
		return TextWriter<TYPE>::Write(value);
	}
}
