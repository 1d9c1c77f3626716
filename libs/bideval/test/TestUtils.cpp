#include "TestUtils.h"

using namespace bideval;
using boost::posix_time::ptime;

DecimalType createDecimal(const std::string& valueString)
{
  return dec::fromString<DecimalType>(valueString);
}

ptime createDeliveryDate(int year, int month, int day)
{
  return ptime(boost::gregorian::date(year, month, day));
}

std::vector<SpecificationCompliance>
createCompliance(const std::vector<bool>& flags)
{
  std::vector<SpecificationCompliance> compliance;
  for (size_t i = 0; i < flags.size(); ++i)
    compliance.emplace_back("REQ-" + std::to_string(i + 1), flags[i]);

  return compliance;
}

BidType createBid(const std::string& id,
		  const std::string& unitPrice,
		  const ptime& deliveryDate,
		  const std::vector<bool>& compliance,
		  const std::set<std::string>& certifications,
		  const std::optional<DecimalType>& sustainability)
{
  return BidType(id, createDecimal(unitPrice), deliveryDate,
		 createCompliance(compliance), certifications, sustainability);
}

BidType createSupplierBid(const std::string& id,
			  const std::string& supplierId,
			  const std::string& unitPrice,
			  const ptime& deliveryDate)
{
  return BidType(id, supplierId, "Supplier " + supplierId,
		 createDecimal(unitPrice), "USD", deliveryDate,
		 createCompliance({true}), {}, std::nullopt);
}

EvaluationCriteria<DecimalType>
createCriteria(const std::string& price,
	       const std::string& delivery,
	       const std::string& quality,
	       const std::string& experience,
	       const std::string& sustainability)
{
  return EvaluationCriteria<DecimalType>(createDecimal(price),
					 createDecimal(delivery),
					 createDecimal(quality),
					 createDecimal(experience),
					 createDecimal(sustainability));
}

EvaluationCriteria<DecimalType> createEqualCriteria()
{
  return createCriteria("20", "20", "20", "20", "20");
}
